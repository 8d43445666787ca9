#include "level_generator.hpp"

#include <cmath>

#include <raylib.h>

namespace monotower::world {

namespace {

bool place(BlockIndex& index, int gx, int gy, int gz, BlockType type, LevelStats& stats) {
    if (index.insert(GridCoord{gx, gy, gz}, type)) {
        return true;
    }
    ++stats.skipped_occupied;
    TraceLog(LOG_DEBUG, "[level] cell %d,%d,%d occupied, %s block skipped", gx, gy, gz, block_type_name(type));
    return false;
}

} // namespace

int LevelGenerator::grid_round(float v) {
    return static_cast<int>(std::lround(v));
}

Level LevelGenerator::generate(const core::GameConfig& cfg, core::IRandomSource& rng, LevelStats* stats) {
    Level level{BlockIndex(cfg.physics.block_size), 0.0f};
    BlockIndex& index = level.index;
    LevelStats st{};

    // 1. Base platform
    for (int x = -kBaseHalfExtent; x <= kBaseHalfExtent; ++x) {
        for (int z = -kBaseHalfExtent; z <= kBaseHalfExtent; ++z) {
            if (place(index, x, 0, z, BlockType::Standard, st)) ++st.base_blocks;
        }
    }

    // 2. Spiral ascent
    int currentY = kFirstSpiralLayer;
    const int towerHeight = cfg.level.tower_height;

    for (int i = 0; i < towerHeight; ++i) {
        const float fi = static_cast<float>(i);
        const float angle = fi * kAngleStep;
        const float radius = kBaseRadius + std::sin(fi * kWobbleFrequency) * kRadiusWobble;
        const int bx = grid_round(std::cos(angle) * radius);
        const int bz = grid_round(std::sin(angle) * radius);

        if (place(index, bx, currentY, bz, BlockType::Standard, st)) ++st.spiral_blocks;

        // Side platform; the random draw happens even if the cell turns out occupied,
        // so the sequence consumed does not depend on layout.
        if (i % kBranchEvery == 0) {
            const int nx = bx + (rng.next_unit() > 0.5f ? 1 : -1);
            if (!index.contains(GridCoord{nx, currentY, bz})) {
                if (place(index, nx, currentY, bz, BlockType::Standard, st)) ++st.branch_blocks;
            }
        }

        // A hazard step does not climb.
        if (i > kHazardAfter && i % kHazardEvery == 0) {
            if (place(index, bx, currentY + 1, bz, BlockType::Hazard, st)) ++st.hazard_blocks;
        } else if (i % 2 == 0) {
            ++currentY;
        }
    }

    // 3. Capstone with a hazard finial
    const int topY = currentY + 1;
    place(index, 0, topY, 0, BlockType::Standard, st);
    if (place(index, 0, topY + 1, 0, BlockType::Hazard, st)) ++st.hazard_blocks;

    level.win_height = static_cast<float>(topY) * cfg.physics.block_size;
    st.top_layer = topY;

    index.seal();

    TraceLog(LOG_INFO, "[level] generated %zu blocks (base=%zu spiral=%zu branch=%zu hazard=%zu skipped=%zu) "
             "regions=%zu top=%d winHeight=%.1f",
             index.size(), st.base_blocks, st.spiral_blocks, st.branch_blocks, st.hazard_blocks,
             st.skipped_occupied, index.region_count(), topY, level.win_height);

    if (stats) *stats = st;
    return level;
}

} // namespace monotower::world
