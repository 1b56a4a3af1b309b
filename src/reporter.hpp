#pragma once

#include "progress_event.hpp"

#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace paper_mt {

// Receives progress events from worker threads; implementations must be
// thread-safe.
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void report(const ProgressEvent& event) = 0;
};

class SilentReporter final : public Reporter {
public:
    void report(const ProgressEvent& /*event*/) override {}
};

// Tagged log lines on `log`, plus a progress bar redrawn in place when
// `show_progress` is set. Workers may deliver completion counts out of order;
// the bar never moves backwards.
class ConsoleReporter final : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& log, bool show_progress = true);

    void report(const ProgressEvent& event) override;

private:
    void draw_progress(std::size_t done, std::size_t total, bool finished);
    void advance_progress(std::size_t done, std::size_t total);
    void end_progress_line();

    std::mutex mutex_;
    std::ostream& log_;
    bool show_progress_;
    bool progress_line_open_ = false;
    std::size_t progress_done_ = 0;
};

class QueueReporter final : public Reporter {
public:
    void report(const ProgressEvent& event) override;
    std::vector<ProgressEvent> pop_all();

private:
    std::mutex mutex_;
    std::vector<ProgressEvent> events_;
};

std::string format_progress_bar(double ratio, std::size_t width);

}  // namespace paper_mt
