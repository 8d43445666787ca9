/**
 * @file test_block_index.cpp
 * @brief Unit tests for the block index: occupancy, lookup and region sealing.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <monotower/world/block_index.hpp>

#include "test_utils.hpp"

using namespace monotower;
using namespace monotower::world;
using namespace test_helpers;
using Catch::Approx;

// =============================================================================
// Occupancy
// =============================================================================

TEST_CASE("BlockIndex: ids follow insertion order", "[world][index]") {
    BlockIndex index(40.0f);

    const Block* a = index.insert(GridCoord{0, 0, 0}, BlockType::Standard);
    REQUIRE(a != nullptr);
    REQUIRE(a->id == 0u);

    const Block* b = index.insert(GridCoord{5, 1, -2}, BlockType::Hazard);
    REQUIRE(b != nullptr);
    REQUIRE(b->id == 1u);
    REQUIRE(b->type == BlockType::Hazard);

    REQUIRE(index.size() == 2);
    REQUIRE(index.blocks()[1].grid == GridCoord{5, 1, -2});
}

TEST_CASE("BlockIndex: occupied cell keeps its first block", "[world][index]") {
    BlockIndex index(40.0f);

    REQUIRE(index.insert(GridCoord{1, 2, 3}, BlockType::Standard) != nullptr);
    REQUIRE(index.insert(GridCoord{1, 2, 3}, BlockType::Hazard) == nullptr);

    REQUIRE(index.size() == 1);
    REQUIRE(index.find(1, 2, 3)->type == BlockType::Standard);
}

TEST_CASE("BlockIndex: absent cells are not an error", "[world][index]") {
    BlockIndex index(40.0f);
    index.insert(GridCoord{0, 0, 0}, BlockType::Standard);

    REQUIRE(index.find(1, 0, 0) == nullptr);
    REQUIRE_FALSE(index.contains(GridCoord{0, 1, 0}));
    REQUIRE_FALSE(index.has_standard(9, 9, 9));
    REQUIRE(index.find(GridCoord{kGridCoordMax + 1, 0, 0}) == nullptr);
}

TEST_CASE("BlockIndex: rejects out-of-range and post-seal inserts", "[world][index]") {
    BlockIndex index(40.0f);

    REQUIRE(index.insert(GridCoord{kGridCoordMin - 1, 0, 0}, BlockType::Standard) == nullptr);

    index.insert(GridCoord{0, 0, 0}, BlockType::Standard);
    index.seal();
    REQUIRE(index.sealed());
    REQUIRE(index.insert(GridCoord{1, 0, 0}, BlockType::Standard) == nullptr);
    REQUIRE(index.size() == 1);
}

TEST_CASE("BlockIndex: has_standard ignores hazards", "[world][index]") {
    auto index = make_index({{0, 0, 0}, {1, 0, 0, BlockType::Hazard}});

    REQUIRE(index.has_standard(0, 0, 0));
    REQUIRE_FALSE(index.has_standard(1, 0, 0));
}

// =============================================================================
// Regions
// =============================================================================

TEST_CASE("BlockIndex: seal groups 4-connected same-layer standard blocks", "[world][index][region]") {
    auto index = make_index({
        {0, 0, 0},
        {1, 0, 0},
        {1, 0, 1},
        {5, 0, 0},                      // isolated
        {0, 1, 0},                      // layer above
        {2, 0, 0, BlockType::Hazard},   // adjacent but not Standard
        {2, 0, 1},                      // reached through (1,0,1), not the hazard
    });

    REQUIRE(index.region_count() == 3);

    const auto r0 = index.region_of(0);
    REQUIRE(r0 != core::kNoRegion);
    REQUIRE(index.region_of(1) == r0);
    REQUIRE(index.region_of(2) == r0);

    REQUIRE(index.region_of(3) != r0);
    REQUIRE(index.region_of(4) != r0);
    REQUIRE(index.region_of(5) == core::kNoRegion);

    REQUIRE(index.region_of(6) == r0);
    REQUIRE(index.region_size(r0) == 4);

    const Aabb& box = index.region_bounds(r0);
    REQUIRE(box.min.x == Approx(-20.0f));
    REQUIRE(box.max.x == Approx(100.0f));
    REQUIRE(box.min.z == Approx(-20.0f));
    REQUIRE(box.max.z == Approx(60.0f));
    REQUIRE(box.min.y == Approx(-20.0f));
    REQUIRE(box.max.y == Approx(20.0f));
}

TEST_CASE("BlockIndex: regions are unavailable before seal", "[world][index][region]") {
    BlockIndex index(40.0f);
    index.insert(GridCoord{0, 0, 0}, BlockType::Standard);

    REQUIRE(index.region_of(0) == core::kNoRegion);
    REQUIRE(index.region_count() == 0);
}

TEST_CASE("BlockIndex: platform collapses to a single region", "[world][index][region]") {
    BlockIndex index(40.0f);
    add_platform(index, 2);
    index.seal();

    REQUIRE(index.size() == 25);
    REQUIRE(index.region_count() == 1);
    REQUIRE(index.region_size(0) == 25);
}
