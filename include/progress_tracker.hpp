#ifndef QRCOMM_PROGRESS_TRACKER_HPP
#define QRCOMM_PROGRESS_TRACKER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include "report_sink.hpp"

// Per-segment timing history and moving-average ETA, used by both the
// transmit loop (encode cost) and the receive loop (time between new segments).
class ProgressTracker {
public:
    // total_bytes 0: unknown (receive side) or empty payload. Remaining bytes
    // are then estimated from the mean size of the segments recorded so far.
    ProgressTracker(uint32_t count, std::size_t total_bytes);

    // Mark the next segment complete. Elapsed time is measured from construction.
    ProgressEvent record(std::size_t segment_bytes, double run_seconds);

    // Same, with explicit clocks.
    ProgressEvent record(std::size_t segment_bytes, double run_seconds,
                         double elapsed_seconds, std::time_t wall_now);

    uint32_t completed() const { return completed_; }
    double average() const;
    double elapsed() const;

private:
    uint32_t count_;
    std::size_t total_bytes_;
    uint32_t completed_ = 0;
    std::size_t bytes_done_ = 0;
    std::vector<double> history_;
    double history_sum_ = 0.0;
    std::chrono::steady_clock::time_point start_;
};

// "HH:MM:SS" on the same day, "MM-DD HH:MM:SS" on a later day,
// "YYYY-MM-DD HH:MM:SS" in a later year.
std::string format_completion_time(const std::tm& now, const std::tm& complete);
std::string format_completion_time(std::time_t now, double remaining_seconds);

#endif // QRCOMM_PROGRESS_TRACKER_HPP
