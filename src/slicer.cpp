#include "slicer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>
#include <string>
#include <zlib.h>

uint32_t crc32_of(const uint8_t* data, std::size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in pieces.
    while (len > 0) {
        uInt piece = static_cast<uInt>(std::min<std::size_t>(len, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, data, piece);
        data += piece;
        len -= piece;
    }
    return static_cast<uint32_t>(crc);
}

std::vector<Segment> slice_payload(const std::vector<uint8_t>& payload,
                                   std::size_t capacity,
                                   bool compressed) {
    if (capacity == 0)
        throw InvalidConfiguration("segment capacity must be a positive number of bytes");

    size_t total_segments = payload.empty() ? 1 : (payload.size() + capacity - 1) / capacity;
    if (total_segments > kMaxSegmentCount)
        throw InvalidConfiguration("payload needs " + std::to_string(total_segments) +
                                   " frames, more than the " +
                                   std::to_string(kMaxSegmentCount) + " a transfer can carry");

    uint32_t stream_crc = crc32_of(payload.data(), payload.size());

    std::vector<Segment> segments;
    segments.reserve(total_segments);

    for (size_t i = 0; i < total_segments; ++i) {
        size_t offset = i * capacity;
        size_t len = std::min(capacity, payload.size() - offset);

        Segment s;
        s.index = static_cast<uint32_t>(i + 1);
        s.count = static_cast<uint32_t>(total_segments);
        s.compressed = compressed;
        s.stream_crc = stream_crc;
        s.data.assign(payload.begin() + offset, payload.begin() + offset + len);

        segments.push_back(std::move(s));
    }

    return segments;
}
