#pragma once

#include "block_index.hpp"

#include <monotower/core/config.hpp>
#include <monotower/core/random_source.hpp>

#include <span>

namespace monotower::world {

struct Level {
    BlockIndex index;
    float win_height{0.0f};

    std::span<const Block> blocks() const { return index.blocks(); }
};

struct LevelStats {
    std::size_t base_blocks{0};
    std::size_t spiral_blocks{0};
    std::size_t branch_blocks{0};
    std::size_t hazard_blocks{0};
    std::size_t skipped_occupied{0};
    int top_layer{0};
};

// Procedural spiral tower: a 5x5 base platform, a climbing spiral with side
// branches and hazards, and a capstone at the top.
class LevelGenerator {
public:
    static constexpr int kBaseHalfExtent = 2;
    static constexpr int kFirstSpiralLayer = 1;

    static constexpr float kAngleStep = 0.35f;
    static constexpr float kBaseRadius = 4.0f;
    static constexpr float kRadiusWobble = 1.5f;
    static constexpr float kWobbleFrequency = 0.1f;

    static constexpr int kBranchEvery = 6;
    static constexpr int kHazardAfter = 10;
    static constexpr int kHazardEvery = 8;

    /// Pure given rng: the same config and random sequence give the same level.
    /// Expects a validated config (block_size > 0).
    static Level generate(const core::GameConfig& cfg, core::IRandomSource& rng, LevelStats* stats = nullptr);

    /// Nearest integer, ties away from zero.
    static int grid_round(float v);
};

} // namespace monotower::world
