#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace paper_mt {

struct TranslationSettings {
    std::string glossary;
    std::string model;
    float temperature = 0.7f;
};

enum class FailureKind {
    Transient,
    Permanent
};

// Thrown by Translator::translate. The executor retries only Transient
// failures; any other exception type is handled as Permanent.
class TranslationError : public std::runtime_error {
public:
    TranslationError(FailureKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FailureKind kind() const { return kind_; }
    bool retryable() const { return kind_ == FailureKind::Transient; }

private:
    FailureKind kind_;
};

class Translator {
public:
    virtual ~Translator() = default;

    // Per-thread isolation point: each worker gets its own translator clone.
    virtual std::unique_ptr<Translator> clone() const = 0;
    virtual std::string translate(const std::string& chunk_text, const TranslationSettings& settings) = 0;
};

}  // namespace paper_mt
