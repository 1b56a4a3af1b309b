#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace paper_mt {

struct AppConfig {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    std::filesystem::path glossary_path;
    std::string model_path;
    std::string target_language = "Korean";
    float temperature = 0.7f;
    std::size_t max_token_length = 4000;
    std::size_t max_workers = 3;
    int max_retries = 2;
    double retry_backoff_seconds = 0.0;
    int n_ctx = 16384;
    int n_gpu_layers = -1;
    int n_threads = 8;
    int max_tokens = 8192;
    bool show_progress = true;
    bool format_output = true;
};

using EnvLookup = std::function<const char*(const char*)>;

void print_usage(const char* program_name);

// Fills config from INPUT_FILE, OUTPUT_FILE, GLOSSARY_FILE, TRANSLATION_MODEL,
// TEMPERATURE, MAX_TOKEN_LENGTH, TRANSLATION_MAX_WORKERS,
// TRANSLATION_MAX_RETRIES, TRANSLATION_RETRY_BACKOFF_SECONDS and
// TARGET_LANGUAGE. Unset or empty variables leave the field unchanged.
bool apply_environment(AppConfig& config, const EnvLookup& lookup, std::string& error);

// Command-line flags override whatever apply_environment set.
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

bool validate_config(AppConfig& config, std::string& error);

}  // namespace paper_mt
