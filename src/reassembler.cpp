#include "reassembler.hpp"
#include "compressor.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <string>

const char* to_string(ReassemblyState state) {
    switch (state) {
        case ReassemblyState::Collecting: return "Collecting";
        case ReassemblyState::Complete: return "Complete";
        case ReassemblyState::Abandoned: return "Abandoned";
    }
    return "Unknown";
}

AcceptResult Reassembler::accept(Segment segment) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != ReassemblyState::Collecting)
        return AcceptResult::Ignored;

    if (segment.count == 0 || segment.count > kMaxSegmentCount ||
        segment.index == 0 || segment.index > segment.count)
        throw std::invalid_argument("segment index " + std::to_string(segment.index) +
                                    " outside 1.." + std::to_string(segment.count));

    // Initialize transfer from the first segment
    if (!count_known_) {
        count_known_ = true;
        count_ = segment.count;
        compressed_ = segment.compressed;
        stream_crc_ = segment.stream_crc;
    } else if (segment.count != count_) {
        throw InconsistentCount("frame " + std::to_string(segment.index) + " announces " +
                                std::to_string(segment.count) + " frames, transfer has " +
                                std::to_string(count_));
    } else if (segment.compressed != compressed_ || segment.stream_crc != stream_crc_) {
        throw InconsistentCount("frame " + std::to_string(segment.index) +
                                " belongs to a different transfer");
    }

    // Duplicate check
    if (chunks_.count(segment.index))
        return AcceptResult::Duplicate;

    received_bytes_ += segment.data.size();
    chunks_.emplace(segment.index, std::move(segment.data));

    if (chunks_.size() == count_)
        state_ = ReassemblyState::Complete;

    return AcceptResult::Accepted;
}

void Reassembler::abandon() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ReassemblyState::Collecting)
        state_ = ReassemblyState::Abandoned;
}

ReassemblyState Reassembler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Reassembler::count_known() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_known_;
}

uint32_t Reassembler::expected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

uint32_t Reassembler::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(chunks_.size());
}

std::size_t Reassembler::bytes_received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_bytes_;
}

bool Reassembler::compressed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compressed_;
}

std::vector<uint32_t> Reassembler::missing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> result;
    uint32_t next = 1;
    for (const auto& entry : chunks_) {
        for (; next < entry.first; ++next)
            result.push_back(next);
        next = entry.first + 1;
    }
    for (; count_known_ && next <= count_; ++next)
        result.push_back(next);
    return result;
}

std::vector<uint8_t> Reassembler::payload() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ReassemblyState::Complete)
        throw std::logic_error(std::string("payload requested while ") + to_string(state_));

    std::vector<uint8_t> stream;
    stream.reserve(received_bytes_);
    for (const auto& entry : chunks_) {
        stream.insert(stream.end(), entry.second.begin(), entry.second.end());
    }

    if (crc32_of(stream.data(), stream.size()) != stream_crc_)
        throw CorruptPayload("reassembled stream fails its CRC-32 check");

    if (!compressed_)
        return stream;
    return decompress_payload(stream);
}

std::string format_index_ranges(const std::vector<uint32_t>& indices) {
    std::string out;
    size_t i = 0;
    while (i < indices.size()) {
        size_t j = i;
        while (j + 1 < indices.size() && indices[j + 1] == indices[j] + 1) ++j;
        if (!out.empty()) out += ",";
        out += std::to_string(indices[i]);
        if (j > i) out += "-" + std::to_string(indices[j]);
        i = j + 1;
    }
    return out;
}
