#include "config.hpp"

#include "pipeline.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace paper_mt {

namespace {

bool parse_int_arg(const std::string& key, const std::string& value, int& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        out = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (...) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        if (!value.empty() && value.front() == '-') {
            throw std::invalid_argument(value);
        }
        out = static_cast<std::size_t>(std::stoull(value, &consumed));
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (...) {
        error = "Invalid non-negative integer for " + key + ": " + value;
        return false;
    }
}

bool parse_double_arg(const std::string& key, const std::string& value, double& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        out = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (...) {
        error = "Invalid number for " + key + ": " + value;
        return false;
    }
}

bool parse_float_arg(const std::string& key, const std::string& value, float& out, std::string& error) {
    double parsed = 0.0;
    if (!parse_double_arg(key, value, parsed, error)) {
        return false;
    }
    out = static_cast<float>(parsed);
    return true;
}

// Worker counts are clamped rather than rejected; anything below 1 becomes 1
// here and validate_config applies the upper bound.
bool parse_workers_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    int parsed = 0;
    if (!parse_int_arg(key, value, parsed, error)) {
        return false;
    }
    out = static_cast<std::size_t>(std::max(1, parsed));
    return true;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <text-file> --output <text-file> --model <gguf-path> [options]\n\n"
        << "Options (environment variable in brackets):\n"
        << "  --input <path>            Source text file [INPUT_FILE]\n"
        << "  --output <path>           Translated output file [OUTPUT_FILE]\n"
        << "  --model <path>            GGUF model used for translation and token counting [TRANSLATION_MODEL]\n"
        << "  --glossary <path>         JSON glossary of {term, translation} objects [GLOSSARY_FILE]\n"
        << "  --target-language <name>  Target language (default: Korean) [TARGET_LANGUAGE]\n"
        << "  --temperature <t>         Sampling temperature 0..2, 0 = greedy (default: 0.7) [TEMPERATURE]\n"
        << "  --max-token-length <n>    Max tokens per chunk (default: 4000) [MAX_TOKEN_LENGTH]\n"
        << "  --workers <n>             Concurrent chunk translations, 1..10 (default: 3) [TRANSLATION_MAX_WORKERS]\n"
        << "  --max-retries <n>         Extra attempts for transient failures (default: 2) [TRANSLATION_MAX_RETRIES]\n"
        << "  --retry-backoff <s>       Seconds between retries (default: 0) [TRANSLATION_RETRY_BACKOFF_SECONDS]\n"
        << "  --max-tokens <n>          Max generated tokens per chunk (default: 8192)\n"
        << "  --ctx <n>                 Context size per worker (default: 16384)\n"
        << "  --n-gpu-layers <n>        llama.cpp GPU layers (default: -1)\n"
        << "  --threads <n>             llama.cpp CPU threads per context (default: 8)\n"
        << "  --no-progress             Disable progress bar output\n"
        << "  --no-format               Do not indent the output file after translation\n"
        << "  -h, --help                Show this help\n";
}

bool apply_environment(AppConfig& config, const EnvLookup& lookup, std::string& error) {
    auto value_of = [&](const char* name) -> std::string {
        const char* raw = lookup ? lookup(name) : nullptr;
        return raw == nullptr ? std::string() : std::string(raw);
    };

    if (const auto v = value_of("INPUT_FILE"); !v.empty()) {
        config.input_path = v;
    }
    if (const auto v = value_of("OUTPUT_FILE"); !v.empty()) {
        config.output_path = v;
    }
    if (const auto v = value_of("GLOSSARY_FILE"); !v.empty()) {
        config.glossary_path = v;
    }
    if (const auto v = value_of("TRANSLATION_MODEL"); !v.empty()) {
        config.model_path = v;
    }
    if (const auto v = value_of("TARGET_LANGUAGE"); !v.empty()) {
        config.target_language = v;
    }
    if (const auto v = value_of("TEMPERATURE"); !v.empty()) {
        if (!parse_float_arg("TEMPERATURE", v, config.temperature, error)) {
            return false;
        }
    }
    if (const auto v = value_of("MAX_TOKEN_LENGTH"); !v.empty()) {
        if (!parse_size_arg("MAX_TOKEN_LENGTH", v, config.max_token_length, error)) {
            return false;
        }
    }
    if (const auto v = value_of("TRANSLATION_MAX_WORKERS"); !v.empty()) {
        if (!parse_workers_arg("TRANSLATION_MAX_WORKERS", v, config.max_workers, error)) {
            return false;
        }
    }
    if (const auto v = value_of("TRANSLATION_MAX_RETRIES"); !v.empty()) {
        if (!parse_int_arg("TRANSLATION_MAX_RETRIES", v, config.max_retries, error)) {
            return false;
        }
    }
    if (const auto v = value_of("TRANSLATION_RETRY_BACKOFF_SECONDS"); !v.empty()) {
        if (!parse_double_arg("TRANSLATION_RETRY_BACKOFF_SECONDS", v, config.retry_backoff_seconds, error)) {
            return false;
        }
    }

    return true;
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_path = require_value(arg);
        } else if (arg == "--model") {
            config.model_path = require_value(arg);
        } else if (arg == "--glossary") {
            config.glossary_path = require_value(arg);
        } else if (arg == "--target-language") {
            config.target_language = require_value(arg);
        } else if (arg == "--temperature") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_float_arg(arg, value, config.temperature, error)) {
                return false;
            }
        } else if (arg == "--max-token-length") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_size_arg(arg, value, config.max_token_length, error)) {
                return false;
            }
        } else if (arg == "--workers") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_workers_arg(arg, value, config.max_workers, error)) {
                return false;
            }
        } else if (arg == "--max-retries") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.max_retries, error)) {
                return false;
            }
        } else if (arg == "--retry-backoff") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_double_arg(arg, value, config.retry_backoff_seconds, error)) {
                return false;
            }
        } else if (arg == "--max-tokens") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.max_tokens, error)) {
                return false;
            }
        } else if (arg == "--ctx") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.n_ctx, error)) {
                return false;
            }
        } else if (arg == "--n-gpu-layers") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.n_gpu_layers, error)) {
                return false;
            }
        } else if (arg == "--threads") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.n_threads, error)) {
                return false;
            }
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else if (arg == "--no-format") {
            config.format_output = false;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    return validate_config(config, error);
}

bool validate_config(AppConfig& config, std::string& error) {
    config.max_workers = clamp_workers(config.max_workers);

    if (config.input_path.empty()) {
        error = "--input is required";
        return false;
    }
    if (config.output_path.empty()) {
        error = "--output is required";
        return false;
    }
    if (config.model_path.empty()) {
        error = "--model is required";
        return false;
    }
    if (config.max_token_length == 0) {
        error = "--max-token-length must be positive";
        return false;
    }
    if (config.max_retries < 0) {
        error = "--max-retries must not be negative";
        return false;
    }
    if (config.retry_backoff_seconds < 0.0) {
        error = "--retry-backoff must not be negative";
        return false;
    }
    if (config.temperature < 0.0f || config.temperature > 2.0f) {
        error = "--temperature must be between 0 and 2";
        return false;
    }
    if (config.max_tokens <= 0) {
        error = "--max-tokens must be positive";
        return false;
    }

    return true;
}

}  // namespace paper_mt
