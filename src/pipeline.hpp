#pragma once

#include "chunk.hpp"
#include "reporter.hpp"
#include "result_aggregator.hpp"
#include "translator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace paper_mt {

inline constexpr std::size_t kMinWorkers = 1;
inline constexpr std::size_t kMaxWorkers = 10;

struct ExecutorConfig {
    std::size_t max_workers = 3;
    int max_retries = 2;
    double retry_backoff_seconds = 0.0;
};

std::size_t clamp_workers(std::size_t requested);

// Drives one chunk to a terminal outcome. Transient failures are retried up to
// config.max_retries more times with config.retry_backoff_seconds between
// attempts; permanent failures end the chunk immediately.
ChunkOutcome translate_chunk_with_retry(
    const Chunk& chunk,
    Translator& translator,
    const TranslationSettings& settings,
    const ExecutorConfig& config,
    ResultAggregator& aggregator,
    Reporter& reporter
);

// Translates all chunks on a pool of clamp_workers(config.max_workers)
// threads, each with its own translator clone. Chunk failures are recorded in
// the aggregator and never abort the run. Returns false only when the pool
// could not be set up; no chunk has been started in that case.
bool translate_chunks_parallel(
    const std::vector<Chunk>& chunks,
    const Translator& prototype,
    const TranslationSettings& settings,
    const ExecutorConfig& config,
    ResultAggregator& aggregator,
    Reporter& reporter,
    std::string& error
);

}  // namespace paper_mt
