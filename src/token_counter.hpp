#pragma once

#include "chunk.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct llama_model;
struct llama_vocab;

namespace paper_mt {

// Implementations must be safe for concurrent count() calls.
class TokenCounter {
public:
    virtual ~TokenCounter() = default;

    virtual std::size_t count(const std::string& text) const = 0;
};

// Counts tokens with the vocabulary of a GGUF model. Only the vocabulary is
// loaded, no weights.
class LlamaTokenCounter final : public TokenCounter {
public:
    explicit LlamaTokenCounter(const std::string& model_path);
    ~LlamaTokenCounter() override;

    LlamaTokenCounter(const LlamaTokenCounter&) = delete;
    LlamaTokenCounter& operator=(const LlamaTokenCounter&) = delete;

    std::size_t count(const std::string& text) const override;

private:
    llama_model* model_ = nullptr;
    const llama_vocab* vocab_ = nullptr;
};

std::vector<Line> measure_lines(const std::vector<std::string>& texts, const TokenCounter& counter);

}  // namespace paper_mt
