#pragma once

#include <cstdint>

namespace monotower::core {

// ============================================================================
// Core Types
// ============================================================================

using Tick = std::uint64_t;
using BlockId = std::uint32_t;
using RegionId = std::uint32_t;

static constexpr BlockId kInvalidBlockId = 0xFFFFFFFFu;
static constexpr RegionId kNoRegion = 0xFFFFFFFFu;

// ============================================================================
// Collision
// ============================================================================

enum class SeamStrategy : std::uint8_t {
    // Contiguous same-layer Standard blocks collide as one bounding box.
    RegionMerge = 0,
    // Per-block boxes; horizontal contacts with a Standard neighbor behind them are skipped.
    NeighborHeuristic = 1,
};

} // namespace monotower::core
