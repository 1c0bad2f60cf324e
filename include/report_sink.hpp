#ifndef QRCOMM_REPORT_SINK_HPP
#define QRCOMM_REPORT_SINK_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

// One per-segment progress report (transmit or receive side).
struct ProgressEvent {
    uint32_t number = 0;          // segments completed so far
    uint32_t count = 0;
    std::size_t segment_bytes = 0;
    std::size_t bytes_done = 0;
    std::size_t bytes_remaining = 0;
    double percent = 0.0;
    double run_seconds = 0.0;     // cost of this segment
    double average_seconds = 0.0;
    double elapsed_seconds = 0.0;
    double remaining_seconds = 0.0;
    std::string completion;       // projected completion timestamp
};

// Injectable reporting sink. Every pipeline stage reports through one of
// these instead of a process wide logger.
class ReportSink {
public:
    virtual ~ReportSink() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void progress(const std::string& verb, const ProgressEvent& event) = 0;
};

// "[2024-01-31 12:00:00] (INFO) message" lines. Thread safe.
class ConsoleReportSink : public ReportSink {
public:
    explicit ConsoleReportSink(std::ostream& out, bool silent = false);

    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;
    void progress(const std::string& verb, const ProgressEvent& event) override;

private:
    void write(const char* level, const std::string& message);

    std::ostream& out_;
    bool silent_;
    std::mutex mutex_;
};

// Human readable rendering of a progress event, shared by sinks.
std::string describe_progress(const std::string& verb, const ProgressEvent& event);
std::string describe_timing(const ProgressEvent& event);

#endif // QRCOMM_REPORT_SINK_HPP
