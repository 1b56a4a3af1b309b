#include "translation_job.hpp"

#include "chunk_planner.hpp"
#include "result_aggregator.hpp"
#include "text_input.hpp"

#include <fstream>
#include <vector>

namespace paper_mt {

bool translate_document(
    const TranslationJob& job,
    const TokenCounter& counter,
    const Translator& prototype,
    Reporter& reporter,
    RunMetrics& out_metrics,
    std::string& error
) {
    out_metrics = RunMetrics{};

    std::vector<std::string> texts;
    if (!read_text_lines(job.input_path, texts, error)) {
        return false;
    }

    const std::vector<Line> lines = measure_lines(texts, counter);

    std::vector<Chunk> chunks;
    if (!plan_chunks(lines, job.max_token_length, chunks, error)) {
        return false;
    }

    const auto parent = job.output_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "Failed to create output directory: " + parent.string();
            return false;
        }
    }

    std::ofstream out(job.output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Failed to open output file: " + job.output_path.string();
        return false;
    }

    ResultAggregator aggregator(chunks.size());
    if (!translate_chunks_parallel(chunks, prototype, job.settings, job.executor, aggregator, reporter, error)) {
        return false;
    }

    if (!aggregator.write_to(out, error)) {
        error += ": " + job.output_path.string();
        return false;
    }

    out_metrics = aggregator.metrics();
    return true;
}

}  // namespace paper_mt
