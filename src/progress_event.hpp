#pragma once

#include "chunk.hpp"

#include <cstddef>
#include <string>

namespace paper_mt {

enum class EventType {
    RunStarted,
    ChunkStarted,
    ChunkRetrying,
    ChunkSucceeded,
    ChunkFailed,
    RunFinished
};

struct ProgressEvent {
    EventType type = EventType::RunStarted;
    std::size_t chunk_index = 0;
    std::size_t total_chunks = 0;
    std::size_t done_chunks = 0;
    std::size_t workers = 0;
    int attempt = 0;
    std::string message;
    RunMetrics metrics;
};

}  // namespace paper_mt
