#ifndef QRCOMM_TRANSMITTER_HPP
#define QRCOMM_TRANSMITTER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "frame_codec.hpp"
#include "frame_sink.hpp"
#include "report_sink.hpp"
#include "slicer.hpp"

// Temporary directory for still frames, removed with everything in it when
// the object goes away.
class TempFrameDir {
public:
    TempFrameDir();
    ~TempFrameDir();

    TempFrameDir(const TempFrameDir&) = delete;
    TempFrameDir& operator=(const TempFrameDir&) = delete;

    const std::string& path() const { return path_; }

    // "<dir>/000000001024.png"; zero padded so name order is offset order.
    std::string frame_path(std::size_t offset) const;

private:
    std::string path_;
};

struct TransmitPlan {
    std::vector<Segment> segments;
    std::size_t payload_bytes = 0;   // before compression
    std::size_t stream_bytes = 0;    // what is actually framed
    bool compressed = false;
};

// Compress (if asked) and segment. Segment size is checked against the frame
// capacity first, so EncodeOverflow is raised before any frame exists.
TransmitPlan plan_transmission(const std::vector<uint8_t>& payload,
                               const TransmitConfig& config,
                               const FrameEncoder& encoder,
                               ReportSink& report);

struct TransmitSummary {
    uint32_t frames = 0;
    std::size_t payload_bytes = 0;
    std::size_t stream_bytes = 0;
    bool compressed = false;
    bool assembled = false;
    bool displayed = false;
    bool cancelled = false;
};

class Transmitter {
public:
    // assembler / display may be null when the run does not need them.
    Transmitter(const TransmitConfig& config, QrCodec& codec, ReportSink& report,
                AnimationAssembler* assembler, Display* display);

    // Reads config.payload_path and transmits it.
    TransmitSummary run(const std::atomic<bool>& cancel);
    TransmitSummary run(const std::vector<uint8_t>& payload, const std::atomic<bool>& cancel);

private:
    // Parallel encode; progress is reported in index order. Returns the frame
    // files in segment order, or an empty list when cancelled.
    std::vector<std::string> encode_frames(const TransmitPlan& plan, const TempFrameDir& dir,
                                           const std::atomic<bool>& cancel);
    bool display_frames(const std::vector<std::string>& files, const std::atomic<bool>& cancel);

    TransmitConfig config_;
    QrCodec& codec_;
    ReportSink& report_;
    AnimationAssembler* assembler_;
    Display* display_;
    FrameEncoder encoder_;
};

std::vector<uint8_t> read_payload_file(const std::string& path);

#endif // QRCOMM_TRANSMITTER_HPP
