#pragma once

#include "chunk.hpp"

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace paper_mt {

// Collects chunk outcomes from concurrent workers and assembles the final
// text in chunk order. Failed chunks are left out of the output without a
// placeholder; their neighbours keep their relative order.
class ResultAggregator {
public:
    explicit ResultAggregator(std::size_t chunk_count);

    // Marks the start of the run; duration is measured from here.
    void start();

    void set_state(std::size_t index, ChunkState state);
    ChunkState state(std::size_t index) const;

    // Returns false for an out-of-range index or an index that already has an
    // outcome.
    bool record(ChunkOutcome outcome);

    std::size_t chunk_count() const { return chunk_count_; }
    std::size_t completed() const;
    bool complete() const;

    RunMetrics metrics() const;

    // Successful texts in chunk order, separated by a blank line.
    std::string assemble() const;

    // Writes assemble() followed by one more separator, so the file ends with
    // a blank line. Writes nothing when no chunk succeeded.
    bool write_to(std::ostream& sink, std::string& error) const;

private:
    std::size_t chunk_count_;

    mutable std::mutex mutex_;
    std::map<std::size_t, ChunkOutcome> outcomes_;
    std::vector<ChunkState> states_;
    std::size_t successes_ = 0;
    std::size_t failures_ = 0;
    std::chrono::steady_clock::time_point started_{};
    std::chrono::steady_clock::time_point last_completed_{};
};

}  // namespace paper_mt
