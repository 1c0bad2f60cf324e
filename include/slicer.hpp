#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

// Largest segment count a transfer may announce. At one frame per second
// this is over six months of slideshow.
constexpr uint32_t kMaxSegmentCount = 1u << 24;

struct Segment {
    uint32_t index = 0;        // 1-based
    uint32_t count = 0;        // total segments of the transfer
    bool compressed = false;   // whole stream is zlib compressed
    uint32_t stream_crc = 0;   // CRC-32 of the whole transmitted stream
    std::vector<uint8_t> data;
};

// Slice a payload into ceil(size / capacity) segments, stamped with the
// shared transfer metadata. An empty payload yields one empty segment.
// Throws InvalidConfiguration when capacity is zero or the payload needs
// more than kMaxSegmentCount segments.
std::vector<Segment> slice_payload(const std::vector<uint8_t>& payload,
                                   std::size_t capacity,
                                   bool compressed);

// CRC-32 (zlib polynomial) of a byte buffer.
uint32_t crc32_of(const uint8_t* data, std::size_t len);
