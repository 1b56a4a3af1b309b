#include "token_counter.hpp"

#include "llama_backend.hpp"

#include <llama.h>

#include <cstdint>
#include <stdexcept>

namespace paper_mt {

LlamaTokenCounter::LlamaTokenCounter(const std::string& model_path) {
    initialize_llama_backend();

    llama_model_params params = llama_model_default_params();
    params.vocab_only = true;
    params.use_mmap = true;

    model_ = llama_model_load_from_file(model_path.c_str(), params);
    if (model_ == nullptr) {
        throw std::runtime_error("failed to load vocabulary from: " + model_path);
    }

    vocab_ = llama_model_get_vocab(model_);
    if (vocab_ == nullptr) {
        llama_model_free(model_);
        model_ = nullptr;
        throw std::runtime_error("llama_model_get_vocab returned null");
    }
}

LlamaTokenCounter::~LlamaTokenCounter() {
    if (model_ != nullptr) {
        llama_model_free(model_);
        model_ = nullptr;
        vocab_ = nullptr;
    }
}

std::size_t LlamaTokenCounter::count(const std::string& text) const {
    if (text.empty()) {
        return 0;
    }

    // With no output buffer llama_tokenize returns the negated token count.
    const int32_t result = llama_tokenize(
        vocab_,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        nullptr,
        0,
        false,
        false
    );

    return static_cast<std::size_t>(result < 0 ? -static_cast<int64_t>(result) : result);
}

std::vector<Line> measure_lines(const std::vector<std::string>& texts, const TokenCounter& counter) {
    std::vector<Line> lines;
    lines.reserve(texts.size());
    for (const auto& text : texts) {
        lines.push_back(Line{text, counter.count(text)});
    }
    return lines;
}

}  // namespace paper_mt
