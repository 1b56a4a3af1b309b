#include "chunk.hpp"

namespace paper_mt {

const char* chunk_state_name(ChunkState state) {
    switch (state) {
    case ChunkState::Pending:
        return "pending";
    case ChunkState::Running:
        return "running";
    case ChunkState::Retrying:
        return "retrying";
    case ChunkState::Succeeded:
        return "succeeded";
    case ChunkState::Failed:
        return "failed";
    }
    return "unknown";
}

}  // namespace paper_mt
