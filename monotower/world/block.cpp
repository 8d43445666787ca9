#include "block.hpp"

namespace monotower::world {

Block make_block(const GridCoord& grid, BlockType type, core::BlockId id, float block_size) {
    const float px = static_cast<float>(grid.gx) * block_size;
    const float py = static_cast<float>(grid.gy) * block_size;
    const float pz = static_cast<float>(grid.gz) * block_size;
    const float half = block_size * 0.5f;

    Block b;
    b.grid = grid;
    b.min = Vector3{px - half, py - half, pz - half};
    b.max = Vector3{px + half, py + half, pz + half};
    b.center = Vector3{px, py, pz};
    b.type = type;
    b.id = id;
    return b;
}

} // namespace monotower::world
