#include "report_sink.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

ConsoleReportSink::ConsoleReportSink(std::ostream& out, bool silent)
    : out_(out), silent_(silent) {}

void ConsoleReportSink::info(const std::string& message) {
    write("INFO", message);
}

void ConsoleReportSink::warning(const std::string& message) {
    write("WARNING", message);
}

void ConsoleReportSink::error(const std::string& message) {
    write("ERROR", message);
}

void ConsoleReportSink::progress(const std::string& verb, const ProgressEvent& event) {
    write("INFO", describe_progress(verb, event));
    write("INFO", describe_timing(event));
}

void ConsoleReportSink::write(const char* level, const std::string& message) {
    if (silent_) return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << stamp << "] (" << level << ") " << message << std::endl;
}

std::string describe_progress(const std::string& verb, const ProgressEvent& event) {
    char line[256];
    std::snprintf(line, sizeof(line), "%s frame %u of %u; %zu/%zu (%zu bytes) [%.0f%%]",
                  verb.c_str(), event.number, event.count,
                  event.bytes_done, event.bytes_remaining, event.segment_bytes,
                  event.percent);
    return line;
}

std::string describe_timing(const ProgressEvent& event) {
    char line[256];
    std::snprintf(line, sizeof(line), "Run: %.2f, Avg: %.2f, Elapsed: %.2f, Remain: %.2f [%s]",
                  event.run_seconds, event.average_seconds, event.elapsed_seconds,
                  event.remaining_seconds, event.completion.c_str());
    return line;
}
