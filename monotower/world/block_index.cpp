#include "block_index.hpp"

#include <algorithm>
#include <queue>

namespace monotower::world {

BlockIndex::BlockIndex(float block_size)
    : block_size_(block_size) {
}

const Block* BlockIndex::insert(const GridCoord& grid, BlockType type) {
    if (sealed_) return nullptr;
    if (!grid_coord_in_range(grid)) return nullptr;

    const std::uint64_t key = pack_grid_key(grid);
    if (cells_.find(key) != cells_.end()) {
        return nullptr;
    }

    const auto id = static_cast<core::BlockId>(blocks_.size());
    blocks_.push_back(make_block(grid, type, id, block_size_));
    cells_.emplace(key, id);
    return &blocks_.back();
}

const Block* BlockIndex::find(const GridCoord& grid) const {
    if (!grid_coord_in_range(grid)) return nullptr;

    auto it = cells_.find(pack_grid_key(grid));
    if (it == cells_.end()) return nullptr;
    return &blocks_[it->second];
}

core::RegionId BlockIndex::region_of(core::BlockId id) const {
    if (id >= region_of_.size()) return core::kNoRegion;
    return region_of_[id];
}

void BlockIndex::seal() {
    if (sealed_) return;

    region_of_.assign(blocks_.size(), core::kNoRegion);
    regions_.clear();

    static constexpr int kDx[4] = {1, -1, 0, 0};
    static constexpr int kDz[4] = {0, 0, 1, -1};

    std::queue<core::BlockId> open;

    for (const Block& start : blocks_) {
        if (start.type != BlockType::Standard) continue;
        if (region_of_[start.id] != core::kNoRegion) continue;

        const auto region = static_cast<core::RegionId>(regions_.size());
        Region r;
        r.bounds = start.bounds();

        region_of_[start.id] = region;
        open.push(start.id);

        // Flood fill over Standard blocks on the same layer, 4-neighborhood.
        while (!open.empty()) {
            const Block& b = blocks_[open.front()];
            open.pop();

            r.bounds.min.x = std::min(r.bounds.min.x, b.min.x);
            r.bounds.min.y = std::min(r.bounds.min.y, b.min.y);
            r.bounds.min.z = std::min(r.bounds.min.z, b.min.z);
            r.bounds.max.x = std::max(r.bounds.max.x, b.max.x);
            r.bounds.max.y = std::max(r.bounds.max.y, b.max.y);
            r.bounds.max.z = std::max(r.bounds.max.z, b.max.z);
            ++r.members;

            for (int n = 0; n < 4; ++n) {
                const Block* nb = find(b.grid.gx + kDx[n], b.grid.gy, b.grid.gz + kDz[n]);
                if (!nb || nb->type != BlockType::Standard) continue;
                if (region_of_[nb->id] != core::kNoRegion) continue;
                region_of_[nb->id] = region;
                open.push(nb->id);
            }
        }

        regions_.push_back(r);
    }

    sealed_ = true;
}

} // namespace monotower::world
