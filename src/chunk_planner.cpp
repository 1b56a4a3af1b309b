#include "chunk_planner.hpp"

#include <utility>

namespace paper_mt {

namespace {

class ChunkBuilder {
public:
    explicit ChunkBuilder(std::vector<Chunk>& out) : out_(out) {}

    bool empty() const { return current_.line_count == 0; }
    std::size_t tokens() const { return current_.token_count; }

    void add(const Line& line, std::size_t line_index) {
        if (empty()) {
            current_.first_line = line_index;
        }
        current_.text += line.text;
        current_.token_count += line.token_count;
        ++current_.line_count;
    }

    void close() {
        if (empty()) {
            return;
        }
        current_.index = out_.size();
        out_.push_back(std::move(current_));
        current_ = Chunk{};
    }

    void emit_standalone(const Line& line, std::size_t line_index) {
        close();
        add(line, line_index);
        close();
    }

private:
    std::vector<Chunk>& out_;
    Chunk current_;
};

void merge_small_tail(std::vector<Chunk>& chunks, double target_chunk_size, std::size_t max_token_length) {
    if (chunks.size() < 2) {
        return;
    }

    Chunk& last = chunks.back();
    Chunk& previous = chunks[chunks.size() - 2];

    if (static_cast<double>(last.token_count) >= kTailMergeRatio * target_chunk_size) {
        return;
    }
    if (previous.token_count + last.token_count > max_token_length) {
        return;
    }

    previous.text += last.text;
    previous.token_count += last.token_count;
    previous.line_count += last.line_count;
    chunks.pop_back();
}

}  // namespace

bool plan_chunks(
    const std::vector<Line>& lines,
    std::size_t max_token_length,
    std::vector<Chunk>& out_chunks,
    std::string& error,
    ChunkPlanSummary* out_summary
) {
    out_chunks.clear();

    if (max_token_length == 0) {
        error = "max_token_length must be positive";
        return false;
    }

    ChunkPlanSummary summary;
    for (const auto& line : lines) {
        summary.total_tokens += line.token_count;
    }

    if (lines.empty()) {
        if (out_summary != nullptr) {
            *out_summary = summary;
        }
        return true;
    }

    ChunkBuilder builder(out_chunks);

    if (summary.total_tokens <= max_token_length) {
        summary.planned_chunks = 1;
        summary.target_chunk_size = static_cast<double>(summary.total_tokens);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            builder.add(lines[i], i);
        }
        builder.close();
        if (out_summary != nullptr) {
            *out_summary = summary;
        }
        return true;
    }

    summary.planned_chunks = (summary.total_tokens + max_token_length - 1) / max_token_length;
    summary.target_chunk_size =
        static_cast<double>(summary.total_tokens) / static_cast<double>(summary.planned_chunks);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const Line& line = lines[i];

        if (line.token_count > max_token_length) {
            builder.emit_standalone(line, i);
            continue;
        }

        // Multi-line chunks stay within the limit even when the target is not reached yet.
        if (!builder.empty() && builder.tokens() + line.token_count > max_token_length) {
            builder.close();
        }

        builder.add(line, i);

        if (static_cast<double>(builder.tokens()) >= summary.target_chunk_size) {
            builder.close();
        }
    }
    builder.close();

    merge_small_tail(out_chunks, summary.target_chunk_size, max_token_length);

    if (out_summary != nullptr) {
        *out_summary = summary;
    }
    return true;
}

}  // namespace paper_mt
