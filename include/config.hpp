#ifndef QRCOMM_CONFIG_HPP
#define QRCOMM_CONFIG_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "frame_codec.hpp"

struct TransmitConfig {
    std::string payload_path;
    std::string outfile;              // empty: no GIF
    std::size_t segment_bytes = 1024;
    bool zlib = false;
    FrameParams frame;                // --size, --ver, --ec
    double delay = 1.0;               // seconds per frame
    bool display = false;
    unsigned workers = 0;             // 0: hardware concurrency

    // Frames are shown when no outfile is written or when asked to.
    bool shows_frames() const { return outfile.empty() || display; }
};

struct ReceiveConfig {
    std::string source;
    std::string outfile;              // empty: stdout
    double timeout = 0.0;             // seconds without a new segment, 0: no limit
    unsigned workers = 0;
};

enum class Mode { Help, Transmit, Receive };

struct CommandLine {
    Mode mode = Mode::Help;
    bool silent = false;
    TransmitConfig tx;
    ReceiveConfig rx;
};

// argv -> CommandLine. Throws InvalidConfiguration on unknown options,
// missing arguments or values that do not parse.
CommandLine parse_command_line(const std::vector<std::string>& args);

// File system and range checks. Throw InvalidConfiguration.
void validate_transmit_config(const TransmitConfig& config);
void validate_receive_config(const ReceiveConfig& config);

unsigned resolve_workers(unsigned requested);

std::string usage(const std::string& program);

#endif // QRCOMM_CONFIG_HPP
