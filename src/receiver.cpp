#include "receiver.hpp"
#include "errors.hpp"
#include "frame_codec.hpp"
#include "progress_tracker.hpp"
#include "work_queue.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

using Clock = std::chrono::steady_clock;

namespace {

constexpr std::chrono::milliseconds kFetchWait(100);
constexpr std::chrono::milliseconds kQueueWait(100);
constexpr unsigned kQueuePerWorker = 2;

} // namespace

Receiver::Receiver(const ReceiveConfig& config, QrCodec& codec, ReportSink& report)
    : config_(config), codec_(codec), report_(report) {}

ReceiveSummary Receiver::run(FrameSource& source, const std::atomic<bool>& cancel) {
    report_.info("Receiving from " + source.describe());

    Reassembler reassembler;
    FrameDecoder decoder(codec_);
    const unsigned worker_count = resolve_workers(config_.workers);
    WorkQueue<CapturedFrame> queue(worker_count * kQueuePerWorker);

    // Guards summary counters, tracker, last_new and the fatal fields.
    std::mutex mutex;
    ReceiveSummary summary;
    std::unique_ptr<ProgressTracker> tracker;
    Clock::time_point last_new = Clock::now();
    std::string fatal_kind;
    std::string fatal_detail;
    std::exception_ptr worker_failure;
    std::atomic<bool> stop{false};

    auto handle = [&](const CapturedFrame& frame) {
        DecodeResult result = decoder.decode(frame.image);
        if (!result.ok()) {
            std::lock_guard<std::mutex> lock(mutex);
            if (result.error == DecodeError::Unreadable) summary.unreadable++;
            else summary.malformed++;
            report_.warning("Frame " + frame.label + ": " + to_string(result.error) +
                            " (" + result.detail + "), skipped");
            return;
        }

        std::size_t bytes = result.segment.data.size();
        uint32_t index = result.segment.index;
        AcceptResult accepted;
        try {
            accepted = reassembler.accept(std::move(result.segment));
        } catch (const InconsistentCount& e) {
            std::lock_guard<std::mutex> lock(mutex);
            if (fatal_kind.empty()) {
                fatal_kind = e.kind();
                fatal_detail = e.what();
            }
            stop = true;
            return;
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (accepted == AcceptResult::Duplicate) {
            summary.duplicates++;
            return;
        }
        if (accepted == AcceptResult::Ignored)
            return;

        auto now = Clock::now();
        double run = std::chrono::duration<double>(now - last_new).count();
        last_new = now;
        if (!tracker)
            tracker = std::make_unique<ProgressTracker>(reassembler.expected(), 0);
        ProgressEvent ev = tracker->record(bytes, run);
        report_.progress("Received", ev);
        report_.info("Frame " + frame.label + " carried segment " + std::to_string(index));

        if (reassembler.state() == ReassemblyState::Complete)
            stop = true;
    };

    std::vector<std::thread> workers;
    // Stops and joins the workers on every exit path.
    struct Joiner {
        std::vector<std::thread>& threads;
        WorkQueue<CapturedFrame>& queue;
        std::atomic<bool>& stop;
        bool drain = false;
        ~Joiner() {
            if (!drain) stop = true;
            queue.close();
            for (auto& t : threads)
                if (t.joinable()) t.join();
        }
    } joiner{workers, queue, stop};

    for (unsigned w = 0; w < worker_count; ++w) {
        workers.emplace_back([&]() {
            try {
                while (!stop) {
                    CapturedFrame frame;
                    if (!queue.pop(frame, kQueueWait)) {
                        if (queue.closed_and_empty()) return;
                        continue;
                    }
                    handle(frame);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!worker_failure) worker_failure = std::current_exception();
                stop = true;
            }
        });
    }

    std::string stop_reason;
    while (!stop && !cancel) {
        if (config_.timeout > 0.0) {
            std::lock_guard<std::mutex> lock(mutex);
            double idle = std::chrono::duration<double>(Clock::now() - last_new).count();
            if (idle > config_.timeout) {
                char line[96];
                std::snprintf(line, sizeof(line), "no new segment for %.1f seconds", idle);
                stop_reason = line;
                break;
            }
        }

        CapturedFrame frame;
        FetchStatus status = source.next(frame, kFetchWait);
        if (status == FetchStatus::Exhausted) {
            stop_reason = "source exhausted";
            break;
        }
        if (status == FetchStatus::Timeout)
            continue;

        {
            std::lock_guard<std::mutex> lock(mutex);
            summary.frames_seen++;
        }
        while (!stop && !cancel && !queue.push(std::move(frame), kQueueWait)) {
        }
    }
    if (cancel)
        stop_reason = "cancelled";

    // Let the workers finish what is already queued unless we are cancelled.
    joiner.drain = !cancel;
    queue.close();
    for (auto& t : workers)
        if (t.joinable()) t.join();

    if (worker_failure)
        std::rethrow_exception(worker_failure);

    if (!fatal_kind.empty()) {
        reassembler.abandon();
        summary.failure_kind = fatal_kind;
        summary.failure_detail = fatal_detail;
    } else if (reassembler.state() == ReassemblyState::Complete) {
        try {
            summary.payload = reassembler.payload();
            summary.success = true;
        } catch (const CorruptPayload& e) {
            summary.failure_kind = e.kind();
            summary.failure_detail = e.what();
        }
    } else {
        reassembler.abandon();
        summary.failure_kind = "Incomplete";
        summary.failure_detail = stop_reason.empty() ? "stopped" : stop_reason;
    }

    summary.state = reassembler.state();
    summary.expected = reassembler.expected();
    summary.received = reassembler.received();
    summary.bytes_received = reassembler.bytes_received();
    summary.missing = reassembler.missing();
    return summary;
}

void report_summary(const ReceiveSummary& summary, ReportSink& report) {
    char line[256];
    std::snprintf(line, sizeof(line),
                  "Frames seen: %zu, unreadable: %zu, malformed: %zu, duplicates: %zu",
                  summary.frames_seen, summary.unreadable, summary.malformed, summary.duplicates);
    report.info(line);

    if (summary.success) {
        std::snprintf(line, sizeof(line), "Received payload of %zu bytes in %u frames",
                      summary.payload.size(), summary.expected);
        report.info(line);
        return;
    }

    std::snprintf(line, sizeof(line), "Recovered %u/%u segments (%zu bytes)",
                  summary.received, summary.expected, summary.bytes_received);
    std::string accounting = line;
    if (summary.expected == 0)
        accounting = "No frame could be decoded";
    else if (!summary.missing.empty())
        accounting += ", missing " + format_index_ranges(summary.missing);

    report.error("Receive failed [" + summary.failure_kind + "]: " + summary.failure_detail);
    report.error(accounting);
}

void write_payload(const std::string& outfile, const std::vector<uint8_t>& payload) {
    if (outfile.empty()) {
        std::cout.write(reinterpret_cast<const char*>(payload.data()),
                        static_cast<std::streamsize>(payload.size()));
        std::cout.flush();
        if (!std::cout)
            throw std::runtime_error("Failed writing payload to stdout");
        return;
    }

    std::ofstream out(outfile, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("Could not open '" + outfile + "' for writing");
    out.write(reinterpret_cast<const char*>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
    out.close();
    if (!out)
        throw std::runtime_error("Failed writing '" + outfile + "'");
}
