#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities: deterministic random sources, block layouts,
 *        physics configs and observers.
 */

#include <monotower/core/config.hpp>
#include <monotower/core/logger.hpp>
#include <monotower/core/random_source.hpp>
#include <monotower/physics/collision_diagnostics.hpp>
#include <monotower/world/block_index.hpp>
#include <monotower/world/level_generator.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace test_helpers {

// =============================================================================
// Logging
// =============================================================================

/** @brief Turns raylib trace output off for the rest of the test run. */
inline void silence_logging() {
    monotower::core::LoggingConfig cfg;
    cfg.enabled = false;
    monotower::core::Logger::instance().init(cfg);
}

// =============================================================================
// Random sources
// =============================================================================

/** @brief Replays a fixed list of values, cycling when exhausted. */
class ScriptedRandomSource final : public monotower::core::IRandomSource {
public:
    explicit ScriptedRandomSource(std::vector<float> values)
        : values_(std::move(values)) {}

    float next_unit() override {
        ++draws_;
        if (values_.empty()) return 0.0f;
        const float v = values_[pos_];
        pos_ = (pos_ + 1) % values_.size();
        return v;
    }

    std::size_t draws() const { return draws_; }

private:
    std::vector<float> values_;
    std::size_t pos_{0};
    std::size_t draws_{0};
};

// =============================================================================
// Block layouts
// =============================================================================

struct Cell {
    int gx;
    int gy;
    int gz;
    monotower::world::BlockType type{monotower::world::BlockType::Standard};
};

/** @brief Builds a sealed index from a list of cells. */
inline monotower::world::BlockIndex make_index(std::initializer_list<Cell> cells, float block_size = 40.0f) {
    monotower::world::BlockIndex index(block_size);
    for (const Cell& c : cells) {
        index.insert(monotower::world::GridCoord{c.gx, c.gy, c.gz}, c.type);
    }
    index.seal();
    return index;
}

/** @brief Square Standard platform of (2*half+1)^2 blocks on layer gy. */
inline void add_platform(monotower::world::BlockIndex& index, int half, int gy = 0) {
    for (int x = -half; x <= half; ++x) {
        for (int z = -half; z <= half; ++z) {
            index.insert(monotower::world::GridCoord{x, gy, z}, monotower::world::BlockType::Standard);
        }
    }
}

/** @brief Level made of one 5x5 platform at gy=0, sealed. */
inline monotower::world::Level make_platform_level(float win_height = 100000.0f, float block_size = 40.0f) {
    monotower::world::Level level{monotower::world::BlockIndex(block_size), win_height};
    add_platform(level.index, 2);
    level.index.seal();
    return level;
}

// =============================================================================
// Observers
// =============================================================================

/** @brief Records every resolver report for later inspection. */
class RecordingObserver final : public monotower::physics::ICollisionObserver {
public:
    void on_contact(const monotower::physics::ContactReport& report) override {
        contacts.push_back(report);
    }

    void on_hazard(const monotower::world::Block& block, const Vector3& position) override {
        (void)position;
        hazards.push_back(block.id);
    }

    std::vector<monotower::physics::ContactReport> contacts;
    std::vector<monotower::core::BlockId> hazards;
};

// =============================================================================
// Fixed seeds for deterministic tests
// =============================================================================

namespace seeds {
    constexpr std::uint32_t DEFAULT_TEST_SEED = 12345u;
    constexpr std::uint32_t ALTERNATE_SEED = 42u;
} // namespace seeds

} // namespace test_helpers
