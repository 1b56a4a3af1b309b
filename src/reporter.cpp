#include "reporter.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace paper_mt {

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

ConsoleReporter::ConsoleReporter(std::ostream& log, bool show_progress)
    : log_(log), show_progress_(show_progress) {}

void ConsoleReporter::end_progress_line() {
    if (progress_line_open_) {
        log_ << "\n";
        progress_line_open_ = false;
    }
}

void ConsoleReporter::draw_progress(std::size_t done, std::size_t total, bool finished) {
    const double ratio = total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const auto pct = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(ratio, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "chunks " << done << "/" << total;

    log_ << line.str();
    progress_line_open_ = !finished;
    if (finished) {
        log_ << "\n";
    }
    log_.flush();
}

void ConsoleReporter::advance_progress(std::size_t done, std::size_t total) {
    if (done <= progress_done_) {
        return;
    }
    progress_done_ = done;
    if (show_progress_) {
        draw_progress(done, total, done >= total);
    }
}

void ConsoleReporter::report(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (event.type) {
    case EventType::RunStarted:
        log_
            << "[run] chunks=" << event.total_chunks
            << " workers=" << event.workers
            << "\n";
        progress_done_ = 0;
        if (show_progress_) {
            draw_progress(0, event.total_chunks, event.total_chunks == 0);
        }
        break;
    case EventType::ChunkStarted:
        break;
    case EventType::ChunkRetrying:
        end_progress_line();
        log_
            << "[retry] chunk=" << event.chunk_index
            << " attempt=" << event.attempt
            << " " << event.message
            << "\n";
        break;
    case EventType::ChunkSucceeded:
        advance_progress(event.done_chunks, event.total_chunks);
        break;
    case EventType::ChunkFailed:
        end_progress_line();
        log_
            << "[error] chunk=" << event.chunk_index
            << " attempts=" << event.attempt
            << " " << event.message
            << "\n";
        advance_progress(event.done_chunks, event.total_chunks);
        break;
    case EventType::RunFinished:
        end_progress_line();
        log_
            << "[done] successes=" << event.metrics.successes
            << " failures=" << event.metrics.failures
            << " time_s=" << std::fixed << std::setprecision(2) << event.metrics.duration_seconds
            << std::defaultfloat
            << "\n";
        break;
    }
    log_.flush();
}

void QueueReporter::report(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<ProgressEvent> QueueReporter::pop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> out;
    out.swap(events_);
    return out;
}

}  // namespace paper_mt
