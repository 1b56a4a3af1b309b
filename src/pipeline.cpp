#include "pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace paper_mt {

namespace {

void backoff(double seconds) {
    if (seconds > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

ChunkOutcome failed_outcome(const Chunk& chunk, int attempts, std::string error) {
    ChunkOutcome outcome;
    outcome.index = chunk.index;
    outcome.state = ChunkState::Failed;
    outcome.attempts = attempts;
    outcome.error = std::move(error);
    return outcome;
}

}  // namespace

std::size_t clamp_workers(std::size_t requested) {
    return std::clamp(requested, kMinWorkers, kMaxWorkers);
}

ChunkOutcome translate_chunk_with_retry(
    const Chunk& chunk,
    Translator& translator,
    const TranslationSettings& settings,
    const ExecutorConfig& config,
    ResultAggregator& aggregator,
    Reporter& reporter
) {
    const int max_attempts = 1 + std::max(0, config.max_retries);

    for (int attempt = 1;; ++attempt) {
        aggregator.set_state(chunk.index, ChunkState::Running);

        try {
            ChunkOutcome outcome;
            outcome.index = chunk.index;
            outcome.text = translator.translate(chunk.text, settings);
            outcome.state = ChunkState::Succeeded;
            outcome.attempts = attempt;
            return outcome;
        } catch (const TranslationError& ex) {
            if (!ex.retryable() || attempt >= max_attempts) {
                const std::string reason = ex.retryable() ? "retries exhausted: " : "permanent failure: ";
                return failed_outcome(chunk, attempt, reason + ex.what());
            }

            aggregator.set_state(chunk.index, ChunkState::Retrying);

            ProgressEvent event;
            event.type = EventType::ChunkRetrying;
            event.chunk_index = chunk.index;
            event.total_chunks = aggregator.chunk_count();
            event.attempt = attempt;
            event.message = ex.what();
            reporter.report(event);

            backoff(config.retry_backoff_seconds);
        } catch (const std::exception& ex) {
            return failed_outcome(chunk, attempt, std::string("permanent failure: ") + ex.what());
        } catch (...) {
            return failed_outcome(chunk, attempt, "permanent failure: unknown translation error");
        }
    }
}

bool translate_chunks_parallel(
    const std::vector<Chunk>& chunks,
    const Translator& prototype,
    const TranslationSettings& settings,
    const ExecutorConfig& config,
    ResultAggregator& aggregator,
    Reporter& reporter,
    std::string& error
) {
    const std::size_t workers_used = chunks.empty()
        ? 0
        : std::min(clamp_workers(config.max_workers), chunks.size());

    std::vector<std::unique_ptr<Translator>> translators;
    translators.reserve(workers_used);
    try {
        for (std::size_t i = 0; i < workers_used; ++i) {
            auto translator = prototype.clone();
            if (!translator) {
                error = "Translator clone returned null";
                return false;
            }
            translators.push_back(std::move(translator));
        }
    } catch (const std::exception& ex) {
        error = std::string("Failed to prepare translator: ") + ex.what();
        return false;
    }

    aggregator.start();

    ProgressEvent started;
    started.type = EventType::RunStarted;
    started.total_chunks = chunks.size();
    started.workers = workers_used;
    reporter.report(started);

    std::atomic<std::size_t> next_index{0};

    auto worker_fn = [&](Translator& translator) {
        while (true) {
            const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= chunks.size()) {
                return;
            }

            const Chunk& chunk = chunks[index];
            bool recorded = false;

            try {
                ProgressEvent event;
                event.type = EventType::ChunkStarted;
                event.chunk_index = chunk.index;
                event.total_chunks = chunks.size();
                reporter.report(event);

                ChunkOutcome outcome =
                    translate_chunk_with_retry(chunk, translator, settings, config, aggregator, reporter);
                const bool succeeded = outcome.succeeded();
                event.attempt = outcome.attempts;
                event.message = outcome.error;
                recorded = aggregator.record(std::move(outcome));

                event.type = succeeded ? EventType::ChunkSucceeded : EventType::ChunkFailed;
                event.done_chunks = aggregator.completed();
                reporter.report(event);
            } catch (const std::exception& ex) {
                // The reporter may be the part that failed, so the chunk is
                // only recorded here.
                if (!recorded) {
                    aggregator.record(failed_outcome(chunk, 0, std::string("worker error: ") + ex.what()));
                }
            } catch (...) {
                if (!recorded) {
                    aggregator.record(failed_outcome(chunk, 0, "worker error: unknown exception"));
                }
            }
        }
    };

    {
        std::vector<std::jthread> pool;
        pool.reserve(workers_used);

        for (std::size_t i = 0; i < workers_used; ++i) {
            try {
                pool.emplace_back(worker_fn, std::ref(*translators[i]));
            } catch (const std::system_error& ex) {
                if (pool.empty()) {
                    error = std::string("Failed to start worker thread: ") + ex.what();
                    return false;
                }
                // The threads already running drain the remaining chunks.
                break;
            }
        }

        for (auto& thread : pool) {
            thread.join();
        }
    }

    ProgressEvent finished;
    finished.type = EventType::RunFinished;
    finished.total_chunks = chunks.size();
    finished.done_chunks = aggregator.completed();
    finished.workers = workers_used;
    finished.metrics = aggregator.metrics();
    reporter.report(finished);

    return true;
}

}  // namespace paper_mt
