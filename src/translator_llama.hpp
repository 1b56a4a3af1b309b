#pragma once

#include "prompt.hpp"
#include "translator.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace paper_mt {

struct LlamaTranslatorConfig {
    std::string model_path;
    std::string target_language = "Korean";
    std::string prompt_template = kDefaultPromptTemplate;
    int n_ctx = 16384;
    int n_gpu_layers = -1;
    int n_threads = 8;
    int max_tokens = 8192;
};

// Translation backed by a local GGUF model. The model weights are loaded once
// and shared by all clones; every clone owns its own llama context.
//
// Failure classes:
//   Transient: context allocation failure, no free KV cache slot
//   Permanent: model mismatch, prompt larger than the context, decode
//              errors, empty output
class LlamaTranslator final : public Translator {
public:
    explicit LlamaTranslator(LlamaTranslatorConfig config);
    ~LlamaTranslator() override;

    std::unique_ptr<Translator> clone() const override;
    std::string translate(const std::string& chunk_text, const TranslationSettings& settings) override;

private:
    struct SharedModel;

    LlamaTranslator(LlamaTranslatorConfig config, std::shared_ptr<SharedModel> shared_model);

    static std::shared_ptr<SharedModel> load_shared_model(const LlamaTranslatorConfig& config);

    std::string build_prompt(const std::string& chunk_text, const std::string& glossary) const;
    std::string postprocess_translation(std::string text) const;

    std::vector<int32_t> tokenize(const std::string& text, bool add_special, bool parse_special) const;
    std::string token_to_piece(int32_t token) const;

    void ensure_context_ready();
    void ensure_sampler(float temperature);

    std::string generate_decoder_only(std::vector<int32_t>& prompt_tokens);
    std::string generate_encoder_decoder(std::vector<int32_t>& prompt_tokens);

    LlamaTranslatorConfig config_;
    std::shared_ptr<SharedModel> shared_model_;

    llama_context* ctx_ = nullptr;
    llama_sampler* sampler_ = nullptr;
    float sampler_temperature_ = -1.0f;
};

}  // namespace paper_mt
