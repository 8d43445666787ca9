#pragma once

#include "block.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace monotower::world {

// Spatial index over the level's blocks, keyed by packed grid coordinate.
//
// Built once: insert() while generating, then seal() to compute same-layer regions.
// After seal() the index is read-only and safe to share between threads.
class BlockIndex {
public:
    explicit BlockIndex(float block_size);

    /// Adds a block at grid. Returns nullptr (and changes nothing) if the cell is
    /// occupied, out of packing range, or the index is sealed.
    /// The returned pointer is valid until the next insert().
    const Block* insert(const GridCoord& grid, BlockType type);

    /// Tags every Standard block with the id of its 4-connected same-layer region.
    void seal();
    bool sealed() const { return sealed_; }

    const Block* find(const GridCoord& grid) const;
    const Block* find(int gx, int gy, int gz) const { return find(GridCoord{gx, gy, gz}); }
    bool contains(const GridCoord& grid) const { return find(grid) != nullptr; }

    bool has_standard(int gx, int gy, int gz) const {
        const Block* b = find(gx, gy, gz);
        return b && b->type == BlockType::Standard;
    }

    std::span<const Block> blocks() const { return blocks_; }
    std::size_t size() const { return blocks_.size(); }
    bool empty() const { return blocks_.empty(); }

    float block_size() const { return block_size_; }

    // --- Regions (valid after seal) ---

    /// Region of a Standard block; core::kNoRegion for hazards or before seal().
    core::RegionId region_of(core::BlockId id) const;
    const Aabb& region_bounds(core::RegionId region) const { return regions_[region].bounds; }
    std::size_t region_size(core::RegionId region) const { return regions_[region].members; }
    std::size_t region_count() const { return regions_.size(); }

private:
    struct Region {
        Aabb bounds{};
        std::size_t members{0};
    };

    float block_size_{1.0f};
    bool sealed_{false};

    std::vector<Block> blocks_{};
    std::unordered_map<std::uint64_t, core::BlockId> cells_{};

    std::vector<core::RegionId> region_of_{};
    std::vector<Region> regions_{};
};

} // namespace monotower::world
