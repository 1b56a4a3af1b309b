#include "result_aggregator.hpp"

#include <ostream>
#include <utility>

namespace paper_mt {

namespace {

constexpr const char* kChunkSeparator = "\n\n";

}  // namespace

ResultAggregator::ResultAggregator(std::size_t chunk_count)
    : chunk_count_(chunk_count), states_(chunk_count, ChunkState::Pending) {
    started_ = std::chrono::steady_clock::now();
    last_completed_ = started_;
}

void ResultAggregator::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = std::chrono::steady_clock::now();
    last_completed_ = started_;
}

void ResultAggregator::set_state(std::size_t index, ChunkState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index < states_.size()) {
        states_[index] = state;
    }
}

ChunkState ResultAggregator::state(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < states_.size() ? states_[index] : ChunkState::Pending;
}

bool ResultAggregator::record(ChunkOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (outcome.index >= chunk_count_ || outcomes_.count(outcome.index) != 0) {
        return false;
    }

    if (outcome.succeeded()) {
        ++successes_;
    } else {
        outcome.state = ChunkState::Failed;
        ++failures_;
    }

    states_[outcome.index] = outcome.state;
    last_completed_ = std::chrono::steady_clock::now();
    outcomes_.emplace(outcome.index, std::move(outcome));
    return true;
}

std::size_t ResultAggregator::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}

bool ResultAggregator::complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size() == chunk_count_;
}

RunMetrics ResultAggregator::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RunMetrics metrics;
    metrics.successes = successes_;
    metrics.failures = failures_;
    metrics.duration_seconds = std::chrono::duration<double>(last_completed_ - started_).count();
    return metrics;
}

std::string ResultAggregator::assemble() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string out;
    bool first = true;
    for (const auto& [index, outcome] : outcomes_) {
        if (!outcome.succeeded()) {
            continue;
        }
        if (!first) {
            out += kChunkSeparator;
        }
        out += outcome.text;
        first = false;
    }
    return out;
}

bool ResultAggregator::write_to(std::ostream& sink, std::string& error) const {
    const std::string text = assemble();
    if (!text.empty()) {
        sink << text << kChunkSeparator;
    }

    sink.flush();
    if (!sink) {
        error = "Failed to write translated output";
        return false;
    }
    return true;
}

}  // namespace paper_mt
