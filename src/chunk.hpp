#pragma once

#include <cstddef>
#include <string>

namespace paper_mt {

struct Line {
    std::string text;
    std::size_t token_count = 0;
};

struct Chunk {
    std::size_t index = 0;
    std::size_t first_line = 0;
    std::size_t line_count = 0;
    std::size_t token_count = 0;
    std::string text;
};

enum class ChunkState {
    Pending,
    Running,
    Retrying,
    Succeeded,
    Failed
};

const char* chunk_state_name(ChunkState state);

struct ChunkOutcome {
    std::size_t index = 0;
    ChunkState state = ChunkState::Failed;
    std::string text;
    int attempts = 0;
    std::string error;

    bool succeeded() const { return state == ChunkState::Succeeded; }
};

struct RunMetrics {
    std::size_t successes = 0;
    std::size_t failures = 0;
    double duration_seconds = 0.0;
};

}  // namespace paper_mt
