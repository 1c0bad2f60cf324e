#ifndef QRCOMM_RECEIVER_HPP
#define QRCOMM_RECEIVER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "frame_source.hpp"
#include "qr_codec.hpp"
#include "reassembler.hpp"
#include "report_sink.hpp"

struct ReceiveSummary {
    ReassemblyState state = ReassemblyState::Collecting;
    bool success = false;
    std::string failure_kind;       // "InconsistentCount", "CorruptPayload", "Incomplete"
    std::string failure_detail;

    uint32_t expected = 0;          // 0 while no frame was decoded
    uint32_t received = 0;
    std::size_t bytes_received = 0;
    std::vector<uint32_t> missing;

    std::size_t frames_seen = 0;
    std::size_t unreadable = 0;
    std::size_t malformed = 0;
    std::size_t duplicates = 0;

    std::vector<uint8_t> payload;   // set on success
};

class Receiver {
public:
    Receiver(const ReceiveConfig& config, QrCodec& codec, ReportSink& report);

    // Pulls candidate images from `source` until the transfer completes, the
    // source runs dry, the stall timeout expires or `cancel` is set. Per-frame
    // decode errors are logged and skipped; InconsistentCount and
    // CorruptPayload end the run and are reported in the summary.
    ReceiveSummary run(FrameSource& source, const std::atomic<bool>& cancel);

private:
    ReceiveConfig config_;
    QrCodec& codec_;
    ReportSink& report_;
};

// Final success / failure lines with segment and byte accounting.
void report_summary(const ReceiveSummary& summary, ReportSink& report);

// Payload to config.outfile, or stdout when no outfile was given.
void write_payload(const std::string& outfile, const std::vector<uint8_t>& payload);

#endif // QRCOMM_RECEIVER_HPP
