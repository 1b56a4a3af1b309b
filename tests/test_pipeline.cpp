// =============================================================================
// Concurrent Executor Tests
// =============================================================================

#include <gtest/gtest.h>
#include "pipeline.hpp"
#include "test_support.hpp"

#include <chrono>
#include <stdexcept>

using namespace paper_mt;
using paper_mt::testing::FakeTranslator;
using paper_mt::testing::echo_upper;
using paper_mt::testing::make_chunks;

namespace {

struct RunResult {
    bool ok = false;
    std::string error;
    RunMetrics metrics;
    std::string output;
    std::vector<ProgressEvent> events;
};

RunResult run(const std::vector<Chunk>& chunks, const FakeTranslator& prototype, const ExecutorConfig& config) {
    RunResult result;
    ResultAggregator aggregator(chunks.size());
    QueueReporter reporter;
    TranslationSettings settings;
    settings.glossary = "- LLM > 대형 언어 모델";

    result.ok = translate_chunks_parallel(chunks, prototype, settings, config, aggregator, reporter, result.error);
    result.metrics = aggregator.metrics();
    result.output = aggregator.assemble();
    result.events = reporter.pop_all();

    for (std::size_t i = 0; i < chunks.size() && result.ok; ++i) {
        const ChunkState state = aggregator.state(i);
        EXPECT_TRUE(state == ChunkState::Succeeded || state == ChunkState::Failed)
            << "chunk " << i << " ended in " << chunk_state_name(state);
    }
    return result;
}

std::size_t count_events(const std::vector<ProgressEvent>& events, EventType type) {
    std::size_t n = 0;
    for (const auto& event : events) {
        if (event.type == type) {
            ++n;
        }
    }
    return n;
}

ExecutorConfig config_with(std::size_t workers, int retries = 2, double backoff = 0.0) {
    ExecutorConfig config;
    config.max_workers = workers;
    config.max_retries = retries;
    config.retry_backoff_seconds = backoff;
    return config;
}

}  // namespace

TEST(ExecutorTest, ClampsWorkerCount) {
    EXPECT_EQ(clamp_workers(0), 1u);
    EXPECT_EQ(clamp_workers(1), 1u);
    EXPECT_EQ(clamp_workers(3), 3u);
    EXPECT_EQ(clamp_workers(10), 10u);
    EXPECT_EQ(clamp_workers(20), 10u);
}

TEST(ExecutorTest, TranslatesAllChunksInOrder) {
    FakeTranslator translator(echo_upper);
    const auto result = run(make_chunks({"a", "b", "c", "d"}), translator, config_with(3));

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.metrics.successes, 4u);
    EXPECT_EQ(result.metrics.failures, 0u);
    EXPECT_EQ(result.output, "A\n\nB\n\nC\n\nD");
    EXPECT_EQ(translator.shared().last_settings.glossary, "- LLM > 대형 언어 모델");
}

TEST(ExecutorTest, TransientFailureIsRetriedUntilSuccess) {
    FakeTranslator translator([](const std::string& text, int attempt) -> std::string {
        if (attempt == 1) {
            throw TranslationError(FailureKind::Transient, "rate limited");
        }
        return "ok:" + text;
    });

    const auto result = run(make_chunks({"x"}), translator, config_with(1, 2));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.metrics.successes, 1u);
    EXPECT_EQ(result.output, "ok:x");
    EXPECT_EQ(translator.shared().calls.load(), 2);
    EXPECT_EQ(count_events(result.events, EventType::ChunkRetrying), 1u);
}

TEST(ExecutorTest, TransientFailuresStopAfterRetryBudget) {
    FakeTranslator translator([](const std::string&, int) -> std::string {
        throw TranslationError(FailureKind::Transient, "timeout");
    });

    const auto result = run(make_chunks({"x"}), translator, config_with(1, 2));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.metrics.successes, 0u);
    EXPECT_EQ(result.metrics.failures, 1u);
    EXPECT_EQ(translator.shared().calls.load(), 3);
    EXPECT_EQ(count_events(result.events, EventType::ChunkRetrying), 2u);
    EXPECT_TRUE(result.output.empty());
}

TEST(ExecutorTest, ZeroRetriesMeansSingleAttempt) {
    FakeTranslator translator([](const std::string&, int) -> std::string {
        throw TranslationError(FailureKind::Transient, "timeout");
    });

    const auto result = run(make_chunks({"x"}), translator, config_with(1, 0));

    EXPECT_EQ(result.metrics.failures, 1u);
    EXPECT_EQ(translator.shared().calls.load(), 1);
}

TEST(ExecutorTest, PermanentFailureIsNotRetried) {
    FakeTranslator translator([](const std::string&, int) -> std::string {
        throw TranslationError(FailureKind::Permanent, "invalid request");
    });

    const auto result = run(make_chunks({"x"}), translator, config_with(1, 5));

    EXPECT_EQ(result.metrics.failures, 1u);
    EXPECT_EQ(translator.shared().calls.load(), 1);
    EXPECT_EQ(count_events(result.events, EventType::ChunkRetrying), 0u);

    ASSERT_EQ(count_events(result.events, EventType::ChunkFailed), 1u);
    for (const auto& event : result.events) {
        if (event.type == EventType::ChunkFailed) {
            EXPECT_NE(event.message.find("invalid request"), std::string::npos);
            EXPECT_EQ(event.attempt, 1);
        }
    }
}

TEST(ExecutorTest, UnclassifiedExceptionIsPermanent) {
    FakeTranslator translator([](const std::string&, int) -> std::string {
        throw std::runtime_error("unexpected");
    });

    const auto result = run(make_chunks({"x"}), translator, config_with(1, 3));

    EXPECT_EQ(result.metrics.failures, 1u);
    EXPECT_EQ(translator.shared().calls.load(), 1);
}

TEST(ExecutorTest, BackoffIsAppliedBetweenAttempts) {
    FakeTranslator translator([](const std::string& text, int attempt) -> std::string {
        if (attempt < 3) {
            throw TranslationError(FailureKind::Transient, "busy");
        }
        return text;
    });

    const auto begin = std::chrono::steady_clock::now();
    const auto result = run(make_chunks({"x"}), translator, config_with(1, 2, 0.05));
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(result.metrics.successes, 1u);
    EXPECT_GE(elapsed, std::chrono::milliseconds(95));
}

TEST(ExecutorTest, OneFailingChunkDoesNotStopTheOthers) {
    FakeTranslator translator([](const std::string& text, int) -> std::string {
        if (text == "c2") {
            throw TranslationError(FailureKind::Permanent, "content rejected");
        }
        return text + "'";
    }, std::chrono::milliseconds(5));

    const auto result = run(make_chunks({"c0", "c1", "c2", "c3", "c4", "c5"}), translator, config_with(3));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.metrics.successes, 5u);
    EXPECT_EQ(result.metrics.failures, 1u);
    EXPECT_EQ(result.output, "c0'\n\nc1'\n\nc3'\n\nc4'\n\nc5'");
    EXPECT_EQ(translator.shared().calls.load(), 6);
}

TEST(ExecutorTest, SingleWorkerRunsSequentiallyInChunkOrder) {
    FakeTranslator translator(echo_upper, std::chrono::milliseconds(2));
    const auto result = run(make_chunks({"a", "b", "c", "d", "e"}), translator, config_with(1));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(translator.shared().max_in_flight.load(), 1);
    EXPECT_EQ(translator.shared().call_order, (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST(ExecutorTest, ConcurrencyNeverExceedsWorkerLimit) {
    FakeTranslator translator(echo_upper, std::chrono::milliseconds(20));
    std::vector<std::string> texts;
    for (int i = 0; i < 12; ++i) {
        texts.push_back("t" + std::to_string(i));
    }

    const auto result = run(make_chunks(texts), translator, config_with(3));

    ASSERT_TRUE(result.ok);
    EXPECT_LE(translator.shared().max_in_flight.load(), 3);
    EXPECT_GE(translator.shared().max_in_flight.load(), 2);
    EXPECT_EQ(result.metrics.successes, 12u);
}

TEST(ExecutorTest, ParallelRunIsFasterThanSequential) {
    const auto chunks = make_chunks({"a", "b", "c", "d", "e", "f"});

    FakeTranslator sequential(echo_upper, std::chrono::milliseconds(50));
    const auto seq_begin = std::chrono::steady_clock::now();
    run(chunks, sequential, config_with(1));
    const auto seq_elapsed = std::chrono::steady_clock::now() - seq_begin;

    FakeTranslator parallel(echo_upper, std::chrono::milliseconds(50));
    const auto par_begin = std::chrono::steady_clock::now();
    run(chunks, parallel, config_with(3));
    const auto par_elapsed = std::chrono::steady_clock::now() - par_begin;

    EXPECT_LT(par_elapsed * 2, seq_elapsed);
}

TEST(ExecutorTest, WorkersLimitedByChunkCount) {
    FakeTranslator translator(echo_upper);
    const auto result = run(make_chunks({"a", "b"}), translator, config_with(8));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(translator.shared().clones.load(), 2);
    ASSERT_FALSE(result.events.empty());
    EXPECT_EQ(result.events.front().type, EventType::RunStarted);
    EXPECT_EQ(result.events.front().workers, 2u);
}

TEST(ExecutorTest, CloneFailureIsSetupError) {
    FakeTranslator translator(echo_upper);
    translator.shared().fail_clone = true;

    const auto result = run(make_chunks({"a", "b"}), translator, config_with(2));

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("clone refused"), std::string::npos);
    EXPECT_EQ(translator.shared().calls.load(), 0);
    EXPECT_TRUE(result.events.empty());
}

TEST(ExecutorTest, EmptyChunkListFinishesImmediately) {
    FakeTranslator translator(echo_upper);
    const auto result = run({}, translator, config_with(3));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.metrics.successes, 0u);
    EXPECT_EQ(result.metrics.failures, 0u);
    EXPECT_EQ(translator.shared().clones.load(), 0);
    EXPECT_EQ(count_events(result.events, EventType::RunStarted), 1u);
    EXPECT_EQ(count_events(result.events, EventType::RunFinished), 1u);
}

TEST(ExecutorTest, EventsAccountForEveryChunk) {
    FakeTranslator translator([](const std::string& text, int) -> std::string {
        if (text == "b") {
            throw TranslationError(FailureKind::Permanent, "no");
        }
        return text;
    });

    const auto result = run(make_chunks({"a", "b", "c"}), translator, config_with(2));

    EXPECT_EQ(count_events(result.events, EventType::ChunkStarted), 3u);
    EXPECT_EQ(count_events(result.events, EventType::ChunkSucceeded), 2u);
    EXPECT_EQ(count_events(result.events, EventType::ChunkFailed), 1u);

    ASSERT_EQ(result.events.back().type, EventType::RunFinished);
    EXPECT_EQ(result.events.back().done_chunks, 3u);
    EXPECT_EQ(result.events.back().metrics.successes, 2u);
    EXPECT_EQ(result.events.back().metrics.failures, 1u);
}

TEST(ExecutorTest, RetryHelperReportsAttemptsOnOutcome) {
    FakeTranslator translator([](const std::string& text, int attempt) -> std::string {
        if (attempt < 2) {
            throw TranslationError(FailureKind::Transient, "flaky");
        }
        return text;
    });

    const auto chunks = make_chunks({"only"});
    ResultAggregator aggregator(1);
    SilentReporter reporter;

    const ChunkOutcome outcome = translate_chunk_with_retry(
        chunks[0], translator, TranslationSettings{}, config_with(1, 2), aggregator, reporter);

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(outcome.text, "only");
    EXPECT_TRUE(outcome.error.empty());
}

namespace {

// Throws from report() for the configured event type and chunk.
class ThrowingReporter final : public Reporter {
public:
    ThrowingReporter(EventType type, std::size_t chunk_index) : type_(type), chunk_index_(chunk_index) {}

    void report(const ProgressEvent& event) override {
        if (event.type == type_ && event.chunk_index == chunk_index_) {
            throw std::runtime_error("log sink closed");
        }
    }

private:
    EventType type_;
    std::size_t chunk_index_;
};

}  // namespace

TEST(ExecutorTest, ReporterFailureBeforeTranslationFailsOnlyThatChunk) {
    FakeTranslator translator(echo_upper);
    const auto chunks = make_chunks({"a", "b", "c"});
    ResultAggregator aggregator(chunks.size());
    ThrowingReporter reporter(EventType::ChunkStarted, 1);
    std::string error;

    ASSERT_TRUE(translate_chunks_parallel(chunks, translator, TranslationSettings{}, config_with(2), aggregator, reporter, error))
        << error;

    EXPECT_TRUE(aggregator.complete());
    EXPECT_EQ(aggregator.metrics().successes, 2u);
    EXPECT_EQ(aggregator.metrics().failures, 1u);
    EXPECT_EQ(aggregator.state(1), ChunkState::Failed);
    EXPECT_EQ(aggregator.assemble(), "A\n\nC");
}

TEST(ExecutorTest, ReporterFailureAfterRecordingKeepsTheResult) {
    FakeTranslator translator(echo_upper);
    const auto chunks = make_chunks({"a", "b"});
    ResultAggregator aggregator(chunks.size());
    ThrowingReporter reporter(EventType::ChunkSucceeded, 0);
    std::string error;

    ASSERT_TRUE(translate_chunks_parallel(chunks, translator, TranslationSettings{}, config_with(1), aggregator, reporter, error))
        << error;

    EXPECT_EQ(aggregator.metrics().successes, 2u);
    EXPECT_EQ(aggregator.metrics().failures, 0u);
    EXPECT_EQ(aggregator.assemble(), "A\n\nB");
}
