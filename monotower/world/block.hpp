#pragma once

#include <monotower/core/types.hpp>

#include <raylib.h>

#include <cstdint>

namespace monotower::world {

// Block types. Values are stable (used in logs and diagnostics).
enum class BlockType : std::uint8_t {
    Standard = 1,
    // Instant death on contact.
    Hazard = 3,
};

inline constexpr const char* block_type_name(BlockType t) {
    return t == BlockType::Hazard ? "hazard" : "standard";
}

struct GridCoord {
    int gx{0};
    int gy{0};
    int gz{0};

    bool operator==(const GridCoord& other) const {
        return gx == other.gx && gy == other.gy && gz == other.gz;
    }
    bool operator!=(const GridCoord& other) const { return !(*this == other); }
};

// Packs a grid coordinate into one 64-bit key (21 bits per axis, two's complement).
// Valid range per axis: [-2^20, 2^20 - 1].
inline constexpr std::uint64_t pack_grid_key(int gx, int gy, int gz) {
    constexpr std::uint64_t kMask = (1ull << 21) - 1ull;
    const auto ux = static_cast<std::uint64_t>(static_cast<std::uint32_t>(gx)) & kMask;
    const auto uy = static_cast<std::uint64_t>(static_cast<std::uint32_t>(gy)) & kMask;
    const auto uz = static_cast<std::uint64_t>(static_cast<std::uint32_t>(gz)) & kMask;
    return (ux << 42) | (uy << 21) | uz;
}

inline constexpr std::uint64_t pack_grid_key(const GridCoord& c) {
    return pack_grid_key(c.gx, c.gy, c.gz);
}

constexpr int kGridCoordMin = -(1 << 20);
constexpr int kGridCoordMax = (1 << 20) - 1;

inline constexpr bool grid_coord_in_range(const GridCoord& c) {
    return c.gx >= kGridCoordMin && c.gx <= kGridCoordMax &&
           c.gy >= kGridCoordMin && c.gy <= kGridCoordMax &&
           c.gz >= kGridCoordMin && c.gz <= kGridCoordMax;
}

struct Aabb {
    Vector3 min{0.0f, 0.0f, 0.0f};
    Vector3 max{0.0f, 0.0f, 0.0f};
};

// Immutable once built: world bounds are derived from the grid coordinate.
struct Block {
    GridCoord grid{};
    Vector3 min{0.0f, 0.0f, 0.0f};
    Vector3 max{0.0f, 0.0f, 0.0f};
    Vector3 center{0.0f, 0.0f, 0.0f};
    BlockType type{BlockType::Standard};
    core::BlockId id{core::kInvalidBlockId};

    Aabb bounds() const { return Aabb{min, max}; }
};

/// Builds a block of side block_size centered on grid * block_size.
Block make_block(const GridCoord& grid, BlockType type, core::BlockId id, float block_size);

} // namespace monotower::world
