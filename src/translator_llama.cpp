#include "translator_llama.hpp"

#include "llama_backend.hpp"

#include <llama.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace paper_mt {

namespace {

std::string trim(std::string s) {
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_ws(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && is_ws(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }

    return s;
}

void decode_or_throw(llama_context* ctx, llama_batch batch, const char* stage) {
    const int32_t rc = llama_decode(ctx, batch);
    if (rc == 0) {
        return;
    }
    if (rc == 1) {
        throw TranslationError(FailureKind::Transient, std::string(stage) + ": no free KV cache slot");
    }
    throw TranslationError(
        FailureKind::Permanent,
        std::string(stage) + ": llama_decode returned " + std::to_string(rc)
    );
}

}  // namespace

struct LlamaTranslator::SharedModel {
    explicit SharedModel(const LlamaTranslatorConfig& config) {
        initialize_llama_backend();

        llama_model_params params = llama_model_default_params();
        params.n_gpu_layers = config.n_gpu_layers;
        params.main_gpu = 0;
        params.use_mmap = true;

        model = llama_model_load_from_file(config.model_path.c_str(), params);
        if (model == nullptr) {
            throw std::runtime_error("llama_model_load_from_file failed for: " + config.model_path);
        }

        vocab = llama_model_get_vocab(model);
        if (vocab == nullptr) {
            llama_model_free(model);
            model = nullptr;
            throw std::runtime_error("llama_model_get_vocab returned null");
        }

        chat_template = llama_model_chat_template(model, nullptr);
    }

    ~SharedModel() {
        if (model != nullptr) {
            llama_model_free(model);
            model = nullptr;
            vocab = nullptr;
        }
    }

    llama_model* model = nullptr;
    const llama_vocab* vocab = nullptr;
    const char* chat_template = nullptr;
};

LlamaTranslator::LlamaTranslator(LlamaTranslatorConfig config)
    : config_(std::move(config)), shared_model_(load_shared_model(config_)) {}

LlamaTranslator::LlamaTranslator(LlamaTranslatorConfig config, std::shared_ptr<SharedModel> shared_model)
    : config_(std::move(config)), shared_model_(std::move(shared_model)) {}

LlamaTranslator::~LlamaTranslator() {
    if (sampler_ != nullptr) {
        llama_sampler_free(sampler_);
        sampler_ = nullptr;
    }

    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
}

std::shared_ptr<LlamaTranslator::SharedModel> LlamaTranslator::load_shared_model(const LlamaTranslatorConfig& config) {
    return std::make_shared<SharedModel>(config);
}

std::unique_ptr<Translator> LlamaTranslator::clone() const {
    return std::unique_ptr<Translator>(new LlamaTranslator(config_, shared_model_));
}

void LlamaTranslator::ensure_context_ready() {
    if (ctx_ != nullptr) {
        return;
    }

    llama_context_params params = llama_context_default_params();
    params.n_ctx = static_cast<uint32_t>(std::max(512, config_.n_ctx));
    params.n_batch = params.n_ctx;
    params.n_ubatch = std::min<uint32_t>(params.n_ctx, 2048);
    params.n_threads = std::max(1, config_.n_threads);
    params.n_threads_batch = std::max(1, config_.n_threads);
    params.offload_kqv = true;
    params.flash_attn_type = LLAMA_FLASH_ATTN_TYPE_AUTO;
    params.no_perf = true;

    ctx_ = llama_init_from_model(shared_model_->model, params);
    if (ctx_ == nullptr) {
        // Usually memory pressure from concurrent workers; a later attempt may succeed.
        throw TranslationError(FailureKind::Transient, "llama_init_from_model failed");
    }
}

void LlamaTranslator::ensure_sampler(float temperature) {
    if (sampler_ != nullptr && sampler_temperature_ == temperature) {
        llama_sampler_reset(sampler_);
        return;
    }

    if (sampler_ != nullptr) {
        llama_sampler_free(sampler_);
        sampler_ = nullptr;
    }

    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    sampler_ = llama_sampler_chain_init(sparams);
    if (sampler_ == nullptr) {
        throw TranslationError(FailureKind::Transient, "llama_sampler_chain_init failed");
    }

    if (temperature <= 0.0f) {
        llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());
    } else {
        llama_sampler_chain_add(sampler_, llama_sampler_init_temp(temperature));
        llama_sampler_chain_add(sampler_, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    }
    sampler_temperature_ = temperature;
}

std::vector<int32_t> LlamaTranslator::tokenize(const std::string& text, bool add_special, bool parse_special) const {
    const int32_t required = -llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        nullptr,
        0,
        add_special,
        parse_special
    );

    if (required <= 0) {
        throw TranslationError(FailureKind::Permanent, "llama_tokenize failed while querying required token count");
    }

    std::vector<llama_token> tokens(static_cast<std::size_t>(required));
    const int32_t written = llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        tokens.data(),
        static_cast<int32_t>(tokens.size()),
        add_special,
        parse_special
    );

    if (written < 0) {
        throw TranslationError(FailureKind::Permanent, "llama_tokenize failed while writing tokens");
    }

    tokens.resize(static_cast<std::size_t>(written));
    return std::vector<int32_t>(tokens.begin(), tokens.end());
}

std::string LlamaTranslator::token_to_piece(int32_t token) const {
    char local[256];
    const int first = llama_token_to_piece(
        shared_model_->vocab,
        static_cast<llama_token>(token),
        local,
        static_cast<int32_t>(sizeof(local)),
        0,
        false
    );

    if (first >= 0) {
        return std::string(local, static_cast<std::size_t>(first));
    }

    std::vector<char> dynamic(static_cast<std::size_t>(-first));
    const int second = llama_token_to_piece(
        shared_model_->vocab,
        static_cast<llama_token>(token),
        dynamic.data(),
        static_cast<int32_t>(dynamic.size()),
        0,
        false
    );

    if (second < 0) {
        throw TranslationError(FailureKind::Permanent, "llama_token_to_piece failed");
    }

    return std::string(dynamic.data(), static_cast<std::size_t>(second));
}

std::string LlamaTranslator::build_prompt(const std::string& chunk_text, const std::string& glossary) const {
    const std::string user_prompt = render_prompt(config_.prompt_template, config_.target_language, glossary, chunk_text);

    if (shared_model_->chat_template == nullptr) {
        return user_prompt;
    }

    const llama_chat_message message{"user", user_prompt.c_str()};
    std::vector<char> buffer(user_prompt.size() * 2 + 256);
    int32_t written = llama_chat_apply_template(
        shared_model_->chat_template,
        &message,
        1,
        true,
        buffer.data(),
        static_cast<int32_t>(buffer.size())
    );

    if (written < 0) {
        // Template not supported by llama.cpp: fall back to the plain prompt.
        return user_prompt;
    }

    if (static_cast<std::size_t>(written) > buffer.size()) {
        buffer.resize(static_cast<std::size_t>(written));
        written = llama_chat_apply_template(
            shared_model_->chat_template,
            &message,
            1,
            true,
            buffer.data(),
            static_cast<int32_t>(buffer.size())
        );
        if (written < 0) {
            return user_prompt;
        }
    }

    return std::string(buffer.data(), static_cast<std::size_t>(written));
}

std::string LlamaTranslator::postprocess_translation(std::string text) const {
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());
    return trim(std::move(text));
}

std::string LlamaTranslator::generate_encoder_decoder(std::vector<int32_t>& prompt_tokens) {
    llama_batch enc_batch = llama_batch_get_one(prompt_tokens.data(), static_cast<int32_t>(prompt_tokens.size()));
    if (llama_encode(ctx_, enc_batch) != 0) {
        throw TranslationError(FailureKind::Permanent, "llama_encode failed");
    }

    llama_token decoder_start = llama_model_decoder_start_token(shared_model_->model);
    if (decoder_start == LLAMA_TOKEN_NULL) {
        decoder_start = llama_vocab_bos(shared_model_->vocab);
    }

    llama_batch dec_batch = llama_batch_get_one(&decoder_start, 1);
    std::string generated;
    llama_token tok = decoder_start;

    for (int i = 0; i < std::max(1, config_.max_tokens); ++i) {
        decode_or_throw(ctx_, dec_batch, "encoder-decoder generation");

        tok = llama_sampler_sample(sampler_, ctx_, -1);
        if (llama_vocab_is_eog(shared_model_->vocab, tok)) {
            break;
        }

        generated += token_to_piece(tok);
        dec_batch = llama_batch_get_one(&tok, 1);
    }

    return generated;
}

std::string LlamaTranslator::generate_decoder_only(std::vector<int32_t>& prompt_tokens) {
    const std::size_t n_ctx_actual = llama_n_ctx(ctx_);

    llama_batch batch = llama_batch_get_one(prompt_tokens.data(), static_cast<int32_t>(prompt_tokens.size()));
    decode_or_throw(ctx_, batch, "prompt");

    std::string generated;
    std::size_t position = prompt_tokens.size();
    llama_token next = 0;

    for (int i = 0; i < std::max(1, config_.max_tokens); ++i) {
        next = llama_sampler_sample(sampler_, ctx_, -1);
        if (llama_vocab_is_eog(shared_model_->vocab, next)) {
            break;
        }

        generated += token_to_piece(next);

        if (i + 1 >= std::max(1, config_.max_tokens) || position + 1 >= n_ctx_actual) {
            break;
        }

        batch = llama_batch_get_one(&next, 1);
        decode_or_throw(ctx_, batch, "continuation token");
        ++position;
    }

    return generated;
}

std::string LlamaTranslator::translate(const std::string& chunk_text, const TranslationSettings& settings) {
    if (!settings.model.empty() && settings.model != config_.model_path) {
        throw TranslationError(
            FailureKind::Permanent,
            "requested model " + settings.model + " but translator was loaded with " + config_.model_path
        );
    }

    ensure_context_ready();
    ensure_sampler(settings.temperature);

    llama_memory_clear(llama_get_memory(ctx_), true);

    std::vector<int32_t> prompt_tokens = tokenize(build_prompt(chunk_text, settings.glossary), true, true);
    if (prompt_tokens.empty()) {
        throw TranslationError(FailureKind::Permanent, "Prompt tokenization produced no tokens");
    }

    const std::size_t n_ctx_actual = llama_n_ctx(ctx_);
    if (prompt_tokens.size() + 1 >= n_ctx_actual) {
        throw TranslationError(
            FailureKind::Permanent,
            "Prompt too long for context window (prompt_tokens=" + std::to_string(prompt_tokens.size()) +
            ", n_ctx=" + std::to_string(n_ctx_actual) + ")"
        );
    }

    std::string generated = llama_model_has_encoder(shared_model_->model)
        ? generate_encoder_decoder(prompt_tokens)
        : generate_decoder_only(prompt_tokens);

    std::string translation = postprocess_translation(std::move(generated));
    if (translation.empty()) {
        throw TranslationError(FailureKind::Permanent, "model returned an empty translation");
    }
    return translation;
}

}  // namespace paper_mt
