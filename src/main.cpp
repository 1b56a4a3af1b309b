#include "config.hpp"
#include "glossary.hpp"
#include "output_formatter.hpp"
#include "reporter.hpp"
#include "token_counter.hpp"
#include "translation_job.hpp"
#include "translator_llama.hpp"

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitSetupError = 1;
constexpr int kExitPartialFailure = 2;

const char* lookup_env(const char* name) {
    return std::getenv(name);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace paper_mt;

    AppConfig config;
    std::string error;

    if (!apply_environment(config, lookup_env, error)) {
        std::cerr << "Environment error: " << error << "\n";
        return kExitSetupError;
    }

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? kExitOk : kExitSetupError;
    }

    std::string glossary;
    if (!config.glossary_path.empty()) {
        std::vector<GlossaryEntry> entries;
        if (!load_glossary(config.glossary_path, entries, error)) {
            std::cerr << "[fatal] " << error << "\n";
            return kExitSetupError;
        }
        glossary = format_glossary(entries);
        std::cout << "[glossary] entries=" << entries.size() << "\n";
    }

    LlamaTranslatorConfig translator_cfg;
    translator_cfg.model_path = config.model_path;
    translator_cfg.target_language = config.target_language;
    translator_cfg.n_ctx = config.n_ctx;
    translator_cfg.n_gpu_layers = config.n_gpu_layers;
    translator_cfg.n_threads = config.n_threads;
    translator_cfg.max_tokens = config.max_tokens;

    std::unique_ptr<LlamaTokenCounter> counter;
    std::unique_ptr<LlamaTranslator> translator;
    try {
        counter = std::make_unique<LlamaTokenCounter>(config.model_path);
        translator = std::make_unique<LlamaTranslator>(translator_cfg);
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] failed to initialize translator: " << ex.what() << "\n";
        return kExitSetupError;
    }

    TranslationJob job;
    job.input_path = config.input_path;
    job.output_path = config.output_path;
    job.max_token_length = config.max_token_length;
    job.settings.glossary = glossary;
    job.settings.model = config.model_path;
    job.settings.temperature = config.temperature;
    job.executor.max_workers = config.max_workers;
    job.executor.max_retries = config.max_retries;
    job.executor.retry_backoff_seconds = config.retry_backoff_seconds;

    ConsoleReporter reporter(std::cerr, config.show_progress);
    RunMetrics metrics;
    if (!translate_document(job, *counter, *translator, reporter, metrics, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return kExitSetupError;
    }

    if (config.format_output) {
        if (!format_output_file(config.output_path, error)) {
            std::cerr << "[error] " << error << "\n";
            return kExitSetupError;
        }
    }

    std::cout
        << "[summary] output=" << config.output_path.string()
        << " successes=" << metrics.successes
        << " failures=" << metrics.failures
        << " time_s=" << std::fixed << std::setprecision(2) << metrics.duration_seconds
        << "\n";

    if (metrics.failures > 0) {
        std::cerr << "[warn] some chunks failed to translate; check the log and consider re-running\n";
        return kExitPartialFailure;
    }

    return kExitOk;
}
