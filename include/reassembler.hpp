#pragma once

#include "slicer.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

enum class ReassemblyState { Collecting, Complete, Abandoned };

const char* to_string(ReassemblyState state);

enum class AcceptResult {
    Accepted,   // new index stored
    Duplicate,  // index already seen, ignored
    Ignored     // session no longer collecting
};

// Collects decoded segments of one transfer in any order. Thread safe: every
// mutation happens under one mutex so completion sees a consistent seen set.
class Reassembler {
public:
    Reassembler() = default;

    // Adopts count, compression flag and stream CRC from the first segment.
    // Throws InconsistentCount when a later segment disagrees, and
    // std::invalid_argument for an index outside 1..count or a count above
    // kMaxSegmentCount.
    AcceptResult accept(Segment segment);

    // Collecting -> Abandoned. No effect once complete.
    void abandon();

    ReassemblyState state() const;
    bool count_known() const;
    uint32_t expected() const;
    uint32_t received() const;
    std::size_t bytes_received() const;
    bool compressed() const;
    std::vector<uint32_t> missing() const;

    // Concatenate in index order, verify the stream CRC and inflate if the
    // transfer was compressed. Throws CorruptPayload on either failure and
    // std::logic_error when called before completion.
    std::vector<uint8_t> payload() const;

private:
    mutable std::mutex mutex_;
    ReassemblyState state_ = ReassemblyState::Collecting;
    bool count_known_ = false;
    uint32_t count_ = 0;
    bool compressed_ = false;
    uint32_t stream_crc_ = 0;

    // Only what arrived is stored, so memory follows the frames seen rather
    // than the count a frame announces.
    std::map<uint32_t, std::vector<uint8_t>> chunks_;
    std::size_t received_bytes_ = 0;
};

// "1-3,7,9-10"
std::string format_index_ranges(const std::vector<uint32_t>& indices);
