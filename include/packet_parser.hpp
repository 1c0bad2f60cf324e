#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <cstddef>

#include "slicer.hpp"

// Frame header layout, little endian:
// [0-1]   magic 'Q' 'C'
// [2]     format version
// [3]     flags (bit 0: compressed)
// [4-7]   index (1-based)
// [8-11]  count
// [12-15] stream CRC-32
// [16-19] frame CRC-32 of bytes 0..15 and the data
// [20...] segment data
constexpr std::size_t kFrameHeaderSize = 20;
constexpr uint8_t kFrameVersion = 1;

// Recoverable, per-frame failures.
enum class DecodeError {
    None,
    Unreadable,  // no QR symbol could be read from the image
    Malformed    // symbol read, framing invalid
};

const char* to_string(DecodeError error);

struct DecodeResult {
    DecodeError error = DecodeError::None;
    Segment segment;
    std::string detail;

    bool ok() const { return error == DecodeError::None; }
};

// Segment -> framed bytes
std::vector<uint8_t> serialize_packet(const Segment& segment);

// Framed bytes -> Segment, never throws
DecodeResult parse_packet(const uint8_t* data, std::size_t len);
