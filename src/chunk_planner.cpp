#include "replistore/chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace replistore {

const char* part_state_name(PartState state) {
    switch (state) {
        case PartState::Pending: return "pending";
        case PartState::InFlight: return "in_flight";
        case PartState::Committed: return "committed";
        case PartState::Failed: return "failed";
    }
    return "unknown";
}

uint64_t ChunkPlan::total_size() const {
    uint64_t total = 0;
    for (const auto& part : parts) {
        total += part.length;
    }
    return total;
}

ChunkPlan plan_chunks(uint64_t total_size, const PlanLimits& limits) {
    if (total_size == 0) {
        throw std::invalid_argument("Cannot plan an empty object");
    }
    if (limits.min_part_size == 0) {
        throw std::invalid_argument("min_part_size must be positive");
    }
    if (limits.min_part_size > limits.max_part_size) {
        throw std::invalid_argument("min_part_size exceeds max_part_size");
    }
    if (limits.target_part_count == 0 || limits.max_parts == 0) {
        throw std::invalid_argument("Part counts must be positive");
    }

    ChunkPlan plan;

    if (total_size <= limits.min_part_size) {
        plan.part_size = total_size;
        plan.multipart = false;
        plan.parts.push_back({1, 0, total_size, PartState::Pending});
        return plan;
    }

    uint64_t part_size = std::clamp<uint64_t>(total_size / limits.target_part_count,
                                              limits.min_part_size, limits.max_part_size);

    // Stay under the backend's part-count ceiling
    uint64_t min_for_count = (total_size + limits.max_parts - 1) / limits.max_parts;
    if (part_size < min_for_count) {
        if (min_for_count > limits.max_part_size) {
            throw std::invalid_argument("Object of " + std::to_string(total_size) +
                                        " bytes exceeds max_parts * max_part_size");
        }
        part_size = min_for_count;
    }

    uint64_t full_parts = total_size / part_size;
    uint64_t remainder = total_size % part_size;
    bool absorb = remainder == 0 || part_size + remainder <= limits.max_part_size;
    uint64_t count = absorb ? full_parts : full_parts + 1;
    if (count > limits.max_parts) {
        throw std::invalid_argument("Object of " + std::to_string(total_size) +
                                    " bytes needs more than max_parts parts");
    }

    plan.part_size = part_size;
    plan.multipart = count > 1;
    plan.parts.reserve(count);

    uint64_t offset = 0;
    for (uint64_t i = 0; i < count; ++i) {
        uint64_t length = part_size;
        if (i + 1 == count) {
            length = total_size - offset;
        }
        plan.parts.push_back({static_cast<int>(i + 1), offset, length, PartState::Pending});
        offset += length;
    }

    return plan;
}

} // namespace replistore
