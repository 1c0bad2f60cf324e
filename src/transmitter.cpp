#include "transmitter.hpp"
#include "compressor.hpp"
#include "errors.hpp"
#include "progress_tracker.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>

using Clock = std::chrono::steady_clock;
namespace fs = std::filesystem;

namespace {

constexpr int kOffsetDigits = 12;
// Ordered-flush wakeup, bounds how late an external cancel is noticed.
constexpr int kFlushPollMs = 100;

// Joins workers on every exit path, telling them to stop first.
struct WorkerGroup {
    std::atomic<bool>& stop;
    std::vector<std::thread> threads;

    explicit WorkerGroup(std::atomic<bool>& s) : stop(s) {}
    ~WorkerGroup() {
        stop = true;
        for (auto& t : threads)
            if (t.joinable()) t.join();
    }
};

} // namespace

// ---------------------- TempFrameDir ----------------------

TempFrameDir::TempFrameDir() {
    std::string pattern = (fs::temp_directory_path() / "qrcomm-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data()))
        throw std::runtime_error("Could not create temporary frame directory: " +
                                 std::string(std::strerror(errno)));
    path_ = buf.data();
}

TempFrameDir::~TempFrameDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string TempFrameDir::frame_path(std::size_t offset) const {
    char name[32];
    std::snprintf(name, sizeof(name), "%0*zu.png", kOffsetDigits, offset);
    return (fs::path(path_) / name).string();
}

// ---------------------- planning ----------------------

std::vector<uint8_t> read_payload_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw InvalidConfiguration("The file '" + path + "' does not exist!");
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        throw std::runtime_error("Failed reading '" + path + "'");
    return data;
}

TransmitPlan plan_transmission(const std::vector<uint8_t>& payload,
                               const TransmitConfig& config,
                               const FrameEncoder& encoder,
                               ReportSink& report) {
    if (config.segment_bytes == 0)
        throw InvalidConfiguration("segment capacity must be a positive number of bytes");

    std::size_t limit = encoder.max_segment_bytes();
    if (config.segment_bytes > limit)
        throw EncodeOverflow(std::to_string(config.segment_bytes) + " bytes per frame exceed the " +
                             std::to_string(limit) + " byte capacity of a version " +
                             std::to_string(encoder.params().qr_version) + "-" +
                             to_char(encoder.params().level) + " frame");

    TransmitPlan plan;
    plan.payload_bytes = payload.size();

    if (config.zlib) {
        CompressionResult c = compress_payload(payload, report);
        plan.compressed = c.applied;
        plan.segments = slice_payload(c.data, config.segment_bytes, c.applied);
        plan.stream_bytes = c.data.size();
    } else {
        plan.segments = slice_payload(payload, config.segment_bytes, false);
        plan.stream_bytes = payload.size();
    }
    return plan;
}

// ---------------------- Transmitter ----------------------

Transmitter::Transmitter(const TransmitConfig& config, QrCodec& codec, ReportSink& report,
                         AnimationAssembler* assembler, Display* display)
    : config_(config), codec_(codec), report_(report),
      assembler_(assembler), display_(display),
      encoder_(codec, config.frame) {}

TransmitSummary Transmitter::run(const std::atomic<bool>& cancel) {
    return run(read_payload_file(config_.payload_path), cancel);
}

TransmitSummary Transmitter::run(const std::vector<uint8_t>& payload, const std::atomic<bool>& cancel) {
    if (!config_.outfile.empty() && !assembler_)
        throw std::invalid_argument("an outfile needs an animation assembler");
    if (config_.shows_frames() && !display_)
        throw std::invalid_argument("displaying frames needs a display");

    TransmitPlan plan = plan_transmission(payload, config_, encoder_, report_);

    TransmitSummary summary;
    summary.frames = static_cast<uint32_t>(plan.segments.size());
    summary.payload_bytes = plan.payload_bytes;
    summary.stream_bytes = plan.stream_bytes;
    summary.compressed = plan.compressed;

    char line[160];
    std::snprintf(line, sizeof(line), "Encoding payload of %zu bytes; %u frames (%.2f seconds)",
                  plan.stream_bytes, summary.frames, config_.delay * summary.frames);
    report_.info(line);

    TempFrameDir dir;
    report_.info("Writing frames to '" + dir.path() + "'");
    std::vector<std::string> files = encode_frames(plan, dir, cancel);
    if (files.empty()) {
        report_.warning("Transmission cancelled while encoding");
        summary.cancelled = true;
        return summary;
    }

    if (!config_.outfile.empty()) {
        assembler_->assemble(files, config_.delay, config_.outfile);
        summary.assembled = true;
    }

    if (config_.shows_frames()) {
        summary.displayed = display_frames(files, cancel);
        if (!summary.displayed) {
            report_.warning("Display cancelled");
            summary.cancelled = true;
        }
    }

    return summary;
}

std::vector<std::string> Transmitter::encode_frames(const TransmitPlan& plan, const TempFrameDir& dir,
                                                    const std::atomic<bool>& cancel) {
    struct Finished {
        std::string path;
        double seconds;
    };

    const std::size_t total = plan.segments.size();
    std::mutex mutex;
    std::condition_variable ready;
    std::map<std::size_t, Finished> finished;
    std::exception_ptr failure;
    std::atomic<std::size_t> next_index{0};
    std::atomic<bool> stop{false};

    unsigned worker_count = std::min<std::size_t>(resolve_workers(config_.workers), total);

    {
        WorkerGroup group(stop);
        for (unsigned w = 0; w < worker_count; ++w) {
            group.threads.emplace_back([&]() {
                while (!stop && !cancel) {
                    std::size_t i = next_index++;
                    if (i >= total) return;

                    const Segment& seg = plan.segments[i];
                    std::size_t offset = i * config_.segment_bytes;
                    try {
                        auto t0 = Clock::now();
                        cv::Mat image = encoder_.encode(seg);
                        std::string path = dir.frame_path(offset);
                        if (!cv::imwrite(path, image))
                            throw std::runtime_error("Could not write frame '" + path + "'");
                        double seconds = std::chrono::duration<double>(Clock::now() - t0).count();

                        std::lock_guard<std::mutex> lock(mutex);
                        finished[i] = Finished{path, seconds};
                    } catch (...) {
                        std::lock_guard<std::mutex> lock(mutex);
                        if (!failure) failure = std::current_exception();
                        stop = true;
                    }
                    ready.notify_all();
                }
            });
        }

        // Flush completions in index order.
        ProgressTracker tracker(static_cast<uint32_t>(total), plan.stream_bytes);
        std::vector<std::string> files;
        files.reserve(total);

        for (std::size_t i = 0; i < total; ++i) {
            Finished done;
            {
                std::unique_lock<std::mutex> lock(mutex);
                while (!finished.count(i)) {
                    if (failure) std::rethrow_exception(failure);
                    if (cancel) return {};
                    ready.wait_for(lock, std::chrono::milliseconds(kFlushPollMs));
                }
                done = finished[i];
                finished.erase(i);
            }

            ProgressEvent ev = tracker.record(plan.segments[i].data.size(), done.seconds);
            report_.progress("Generating", ev);
            files.push_back(done.path);
        }

        return files;
    }
}

bool Transmitter::display_frames(const std::vector<std::string>& files, const std::atomic<bool>& cancel) {
    auto frame_time = std::chrono::milliseconds(static_cast<long long>(config_.delay * 1000.0));
    char line[128];

    for (std::size_t i = 0; i < files.size(); ++i) {
        if (cancel) return false;

        std::snprintf(line, sizeof(line), "Displaying frame %zu of %zu for %.2fs",
                      i + 1, files.size(), config_.delay);
        report_.info(line);

        cv::Mat image = cv::imread(files[i], cv::IMREAD_COLOR);
        if (image.empty())
            throw std::runtime_error("Could not read frame '" + files[i] + "'");

        if (!display_->show(image, frame_time, cancel)) {
            display_->close();
            return false;
        }
    }
    display_->close();
    return true;
}
