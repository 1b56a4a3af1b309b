#pragma once

#include "chunk.hpp"
#include "pipeline.hpp"
#include "reporter.hpp"
#include "token_counter.hpp"
#include "translator.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace paper_mt {

struct TranslationJob {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    std::size_t max_token_length = 4000;
    TranslationSettings settings;
    ExecutorConfig executor;
};

// Reads, measures and plans the input, translates every chunk and writes the
// successful translations to output_path in chunk order.
//
// Returns false with `error` set when the job cannot start (unreadable input,
// invalid limits, output not writable, translator setup failure) or when the
// output cannot be written. Chunk failures do not fail the job; they show up
// in out_metrics.failures.
bool translate_document(
    const TranslationJob& job,
    const TokenCounter& counter,
    const Translator& prototype,
    Reporter& reporter,
    RunMetrics& out_metrics,
    std::string& error
);

}  // namespace paper_mt
