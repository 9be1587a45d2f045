#pragma once

#include "replistore/constants.hpp"

#include <cstdint>
#include <vector>

namespace replistore {

enum class PartState {
    Pending,
    InFlight,
    Committed,
    Failed
};

const char* part_state_name(PartState state);

/// One byte range [offset, offset + length) of a multipart sequence.
struct ChunkPart {
    int part_number = 0;            ///< 1-based, contiguous
    uint64_t offset = 0;
    uint64_t length = 0;
    PartState state = PartState::Pending;

    uint64_t end() const { return offset + length; }
};

struct ChunkPlan {
    uint64_t part_size = 0;
    bool multipart = false;         ///< false: a single atomic put
    std::vector<ChunkPart> parts;

    uint64_t total_size() const;
};

/// Part-size constraints of one backend.
struct PlanLimits {
    uint64_t min_part_size = constants::DEFAULT_MIN_PART_SIZE;
    uint64_t max_part_size = constants::DEFAULT_MAX_PART_SIZE;
    uint32_t max_parts = constants::DEFAULT_MAX_PARTS;
    uint32_t target_part_count = constants::DEFAULT_TARGET_PART_COUNT;
};

/// Split `total_size` bytes into ordered, contiguous parts.
///
/// part size = clamp(total_size / target_part_count, min, max), raised when
/// needed so the plan never exceeds max_parts. The final part absorbs the
/// remainder when that keeps it within max_part_size, otherwise the
/// remainder becomes a short trailing part. Objects no larger than
/// min_part_size produce a single non-multipart part.
///
/// Throws std::invalid_argument for total_size == 0, min_part_size == 0,
/// min > max, a zero target or max part count, or an object too large for
/// max_parts * max_part_size.
ChunkPlan plan_chunks(uint64_t total_size, const PlanLimits& limits = {});

} // namespace replistore
