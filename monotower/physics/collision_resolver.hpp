#pragma once

#include "collision_diagnostics.hpp"
#include "player_state.hpp"

#include <monotower/core/config.hpp>
#include <monotower/world/block_index.hpp>

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace monotower::physics {

using HazardCallback = std::function<void()>;

struct ResolveResult {
    int contacts{0};
    int resolved{0};
    int suppressed{0};
    bool grounded_contact{false};
    bool hazard{false};
};

// Sphere (player) vs static unit-cube blocks, one pass per call.
//
// Broad phase: per-axis center distance against collision_range.
// Narrow phase: closest point on the box; contact iff kMinDistSq < d^2 < r^2.
// Seam suppression: with RegionMerge, Standard blocks collide as the bounding box of
// their precomputed same-layer region (each region at most once per call); with
// NeighborHeuristic, a mostly horizontal contact backed by a Standard neighbor is skipped.
// Either way, a falling contact with a nearly horizontal normal is treated as a seam.
// A resolved contact grounds only while moving into an upward-facing surface.
class CollisionResolver {
public:
    static constexpr float kMinDistSq = 1e-5f;
    static constexpr float kGroundNormalY = 0.7f;

    static constexpr float kSeamMaxNormalY = 0.35f;
    static constexpr float kSeamMinNormalXZ = 0.5f;
    static constexpr float kNeighborMaxNormalY = 0.5f;

    explicit CollisionResolver(const core::PhysicsConfig& cfg);

    void set_observer(ICollisionObserver* observer) { observer_ = observer; }
    ICollisionObserver* observer() const { return observer_; }

    core::SeamStrategy strategy() const { return strategy_; }

    /// One solver pass. On the first hazard contact, calls on_hazard and returns
    /// immediately (no grounding update this call).
    ResolveResult resolve(PlayerState& player,
                          std::span<const world::Block> blocks,
                          const world::BlockIndex& index,
                          const HazardCallback& on_hazard);

    ResolveResult resolve(PlayerState& player, const world::BlockIndex& index, const HazardCallback& on_hazard) {
        return resolve(player, index.blocks(), index, on_hazard);
    }

    std::uint64_t calls() const { return calls_; }

private:
    bool has_standard_neighbor_(const world::BlockIndex& index, const world::Block& b, const Vector3& normal) const;
    void update_ground_state_(PlayerState& player, bool grounded_this_call) const;

    float radius_{20.0f};
    float collision_range_{80.0f};
    int coyote_frames_{5};
    core::SeamStrategy strategy_{core::SeamStrategy::RegionMerge};

    ICollisionObserver* observer_{nullptr};
    std::uint64_t calls_{0};

    // Regions already tested in the current call.
    std::vector<core::RegionId> visited_regions_{};
};

} // namespace monotower::physics
