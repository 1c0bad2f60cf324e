#include "progress_tracker.hpp"
#include <algorithm>
#include <cmath>

using namespace std::chrono;

ProgressTracker::ProgressTracker(uint32_t count, std::size_t total_bytes)
    : count_(count), total_bytes_(total_bytes), start_(steady_clock::now()) {}

double ProgressTracker::average() const {
    if (history_.empty()) return 0.0;
    return history_sum_ / history_.size();
}

double ProgressTracker::elapsed() const {
    return duration<double>(steady_clock::now() - start_).count();
}

ProgressEvent ProgressTracker::record(std::size_t segment_bytes, double run_seconds) {
    return record(segment_bytes, run_seconds, elapsed(), system_clock::to_time_t(system_clock::now()));
}

ProgressEvent ProgressTracker::record(std::size_t segment_bytes, double run_seconds,
                                      double elapsed_seconds, std::time_t wall_now) {
    completed_ = std::min(completed_ + 1, count_);
    bytes_done_ = total_bytes_ ? std::min(bytes_done_ + segment_bytes, total_bytes_)
                               : bytes_done_ + segment_bytes;
    history_.push_back(run_seconds);
    history_sum_ += run_seconds;

    ProgressEvent ev;
    ev.number = completed_;
    ev.count = count_;
    ev.segment_bytes = segment_bytes;
    ev.bytes_done = bytes_done_;
    // Unknown totals: remaining segments at the mean segment size so far.
    ev.bytes_remaining = total_bytes_ ? total_bytes_ - bytes_done_
                                      : completed_ ? (count_ - completed_) * (bytes_done_ / completed_) : 0;
    // Unknown or empty totals fall back to the segment ratio.
    ev.percent = total_bytes_ ? 100.0 * bytes_done_ / total_bytes_
                              : 100.0 * completed_ / std::max<uint32_t>(count_, 1);
    ev.run_seconds = run_seconds;
    ev.average_seconds = average();
    ev.elapsed_seconds = elapsed_seconds;
    ev.remaining_seconds = (count_ - completed_) * ev.average_seconds;
    ev.completion = format_completion_time(wall_now, ev.remaining_seconds);
    return ev;
}

std::string format_completion_time(const std::tm& now, const std::tm& complete) {
    const char* format = "%H:%M:%S";
    if (complete.tm_year != now.tm_year)
        format = "%Y-%m-%d %H:%M:%S";
    else if (complete.tm_yday != now.tm_yday)
        format = "%m-%d %H:%M:%S";

    char text[32];
    std::strftime(text, sizeof(text), format, &complete);
    return text;
}

std::string format_completion_time(std::time_t now, double remaining_seconds) {
    std::time_t done = now + static_cast<std::time_t>(std::llround(remaining_seconds));
    std::tm now_tm{};
    std::tm done_tm{};
    localtime_r(&now, &now_tm);
    localtime_r(&done, &done_tm);
    return format_completion_time(now_tm, done_tm);
}
