#pragma once
#include <vector>
#include <cstdint>

class ReportSink;

struct CompressionResult {
    std::vector<uint8_t> data;  // what gets segmented
    bool applied = false;       // data is a zlib stream
};

// zlib at Z_BEST_COMPRESSION. The candidate is kept only when it is strictly
// smaller than the input, otherwise the input is returned unchanged.
CompressionResult compress_payload(const std::vector<uint8_t>& payload, ReportSink& report);

// Inflate a zlib stream of unknown decompressed size.
// Throws CorruptPayload on malformed or truncated input.
std::vector<uint8_t> decompress_payload(const std::vector<uint8_t>& stream);
