#include "packet_parser.hpp"
#include <cstdint>
#include <cstddef>

namespace {

constexpr uint8_t kMagic0 = 'Q';
constexpr uint8_t kMagic1 = 'C';
constexpr uint8_t kFlagCompressed = 0x01;

void put_u32(std::vector<uint8_t>& buffer, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer.push_back((value >> (i * 8)) & 0xFF);
    }
}

uint32_t get_u32(const uint8_t* data) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data[i]) << (i * 8);
    }
    return value;
}

uint32_t frame_crc(const uint8_t* header, const uint8_t* body, std::size_t body_len) {
    std::vector<uint8_t> covered(header, header + 16);
    covered.insert(covered.end(), body, body + body_len);
    return crc32_of(covered.data(), covered.size());
}

DecodeResult malformed(std::string detail) {
    DecodeResult result;
    result.error = DecodeError::Malformed;
    result.detail = std::move(detail);
    return result;
}

} // namespace

const char* to_string(DecodeError error) {
    switch (error) {
        case DecodeError::None: return "None";
        case DecodeError::Unreadable: return "Unreadable";
        case DecodeError::Malformed: return "Malformed";
    }
    return "Unknown";
}

std::vector<uint8_t> serialize_packet(const Segment& segment) {
    std::vector<uint8_t> buffer;
    buffer.reserve(kFrameHeaderSize + segment.data.size());

    buffer.push_back(kMagic0);
    buffer.push_back(kMagic1);
    buffer.push_back(kFrameVersion);
    buffer.push_back(segment.compressed ? kFlagCompressed : 0);
    put_u32(buffer, segment.index);
    put_u32(buffer, segment.count);
    put_u32(buffer, segment.stream_crc);
    put_u32(buffer, frame_crc(buffer.data(), segment.data.data(), segment.data.size()));

    // payload
    buffer.insert(buffer.end(), segment.data.begin(), segment.data.end());

    return buffer;
}

DecodeResult parse_packet(const uint8_t* data, std::size_t len) {
    if (len < kFrameHeaderSize)
        return malformed("frame too short (" + std::to_string(len) + " bytes)");

    if (data[0] != kMagic0 || data[1] != kMagic1)
        return malformed("missing frame magic");

    if (data[2] != kFrameVersion)
        return malformed("unsupported frame version " + std::to_string(data[2]));

    if (data[3] & ~kFlagCompressed)
        return malformed("unknown frame flags");

    const uint8_t* body = data + kFrameHeaderSize;
    std::size_t body_len = len - kFrameHeaderSize;

    if (get_u32(data + 16) != frame_crc(data, body, body_len))
        return malformed("frame CRC mismatch");

    DecodeResult result;
    result.segment.compressed = (data[3] & kFlagCompressed) != 0;
    result.segment.index = get_u32(data + 4);
    result.segment.count = get_u32(data + 8);
    result.segment.stream_crc = get_u32(data + 12);

    if (result.segment.count == 0)
        return malformed("frame count is zero");

    if (result.segment.count > kMaxSegmentCount)
        return malformed("frame count " + std::to_string(result.segment.count) +
                         " above the " + std::to_string(kMaxSegmentCount) + " limit");

    if (result.segment.index == 0 || result.segment.index > result.segment.count)
        return malformed("frame index " + std::to_string(result.segment.index) +
                         " outside 1.." + std::to_string(result.segment.count));

    result.segment.data.assign(body, body + body_len);
    return result;
}
