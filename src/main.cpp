#include "config.hpp"
#include "errors.hpp"
#include "frame_source.hpp"
#include "gif_assembler.h"
#include "opencv_display.hpp"
#include "opencv_qr_codec.hpp"
#include "receiver.hpp"
#include "report_sink.hpp"
#include "transmitter.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static std::atomic<bool> should_exit{false};

void signal_handler(int) {
    should_exit = true;
}

// Fatal messages go out even with --silent.
static int fail(const std::string& kind, const std::string& message, int code) {
    std::cerr << "qrcomm: " << kind << ": " << message << std::endl;
    return code;
}

static int run_transmit(const TransmitConfig& config, QrCodec& codec, ReportSink& report) {
    validate_transmit_config(config);

    GifAssembler assembler(report);
    std::unique_ptr<OpenCvDisplay> display;
    if (config.shows_frames())
        display = std::make_unique<OpenCvDisplay>();

    Transmitter transmitter(config, codec, report, &assembler, display.get());
    TransmitSummary summary = transmitter.run(should_exit);

    if (summary.cancelled)
        return fail("cancelled", "transmission interrupted", 1);

    report.info("Transmitted " + std::to_string(summary.payload_bytes) + " bytes in " +
                std::to_string(summary.frames) + " frames" +
                (summary.compressed ? " (zlib, " + std::to_string(summary.stream_bytes) + " bytes framed)" : ""));
    return 0;
}

static int run_receive(const ReceiveConfig& config, QrCodec& codec, ReportSink& report) {
    validate_receive_config(config);

    std::unique_ptr<FrameSource> source = open_frame_source(config.source);
    Receiver receiver(config, codec, report);
    ReceiveSummary summary = receiver.run(*source, should_exit);
    report_summary(summary, report);

    if (!summary.success)
        return fail(summary.failure_kind, summary.failure_detail, 1);

    write_payload(config.outfile, summary.payload);
    if (!config.outfile.empty())
        report.info("Payload written to '" + config.outfile + "'");
    return 0;
}

int main(int argc, char** argv) {
    std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "qrcomm";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CommandLine cl;
    try {
        cl = parse_command_line(args);
    } catch (const InvalidConfiguration& e) {
        std::cerr << usage(program) << std::endl;
        return fail(e.kind(), e.what(), 2);
    }

    if (cl.mode == Mode::Help) {
        std::cout << usage(program);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ConsoleReportSink report(std::cerr, cl.silent);
    OpenCvQrCodec codec;

    try {
        if (cl.mode == Mode::Transmit)
            return run_transmit(cl.tx, codec, report);
        return run_receive(cl.rx, codec, report);
    } catch (const InvalidConfiguration& e) {
        return fail(e.kind(), e.what(), 2);
    } catch (const QrCommError& e) {
        return fail(e.kind(), e.what(), 1);
    } catch (const std::exception& e) {
        return fail("error", e.what(), 1);
    }
}
