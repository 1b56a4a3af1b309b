#pragma once

#include "chunk.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace paper_mt {

// Last chunk is folded into its predecessor when smaller than this share of
// the target size.
inline constexpr double kTailMergeRatio = 0.7;

struct ChunkPlanSummary {
    std::size_t total_tokens = 0;
    std::size_t planned_chunks = 0;
    double target_chunk_size = 0.0;
};

// Splits lines into balanced, token-bounded chunks. Chunk sizes aim at
// total / ceil(total / max_token_length) instead of packing each chunk up to
// the limit. Lines are never split; a single line larger than the limit
// becomes a chunk of its own.
bool plan_chunks(
    const std::vector<Line>& lines,
    std::size_t max_token_length,
    std::vector<Chunk>& out_chunks,
    std::string& error,
    ChunkPlanSummary* out_summary = nullptr
);

}  // namespace paper_mt
