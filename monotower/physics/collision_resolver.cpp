#include "collision_resolver.hpp"

#include <algorithm>
#include <cmath>

#include <raymath.h>

namespace monotower::physics {

namespace {

inline float clampf(float v, float lo, float hi) {
    return std::max(lo, std::min(hi, v));
}

} // namespace

CollisionResolver::CollisionResolver(const core::PhysicsConfig& cfg)
    : radius_(cfg.player_radius)
    , collision_range_(cfg.collision_range)
    , coyote_frames_(cfg.coyote_frames)
    , strategy_(cfg.seam_strategy) {
}

bool CollisionResolver::has_standard_neighbor_(const world::BlockIndex& index, const world::Block& b,
                                               const Vector3& normal) const {
    const float ax = std::fabs(normal.x);
    const float az = std::fabs(normal.z);

    if (ax > az) {
        const int sign = normal.x > 0.0f ? 1 : -1;
        return index.has_standard(b.grid.gx + sign, b.grid.gy, b.grid.gz);
    }
    const int sign = normal.z > 0.0f ? 1 : -1;
    return index.has_standard(b.grid.gx, b.grid.gy, b.grid.gz + sign);
}

void CollisionResolver::update_ground_state_(PlayerState& player, bool grounded_this_call) const {
    if (grounded_this_call) {
        player.grounded = true;
        player.coyote_timer = coyote_frames_;
    } else if (player.coyote_timer > 0) {
        --player.coyote_timer;
    } else {
        player.grounded = false;
    }
}

ResolveResult CollisionResolver::resolve(PlayerState& player,
                                         std::span<const world::Block> blocks,
                                         const world::BlockIndex& index,
                                         const HazardCallback& on_hazard) {
    ++calls_;
    visited_regions_.clear();

    ResolveResult result;
    const float r = radius_;
    const float r_sq = r * r;
    Vector3& p = player.position;

    for (const world::Block& b : blocks) {
        if (std::fabs(b.center.x - p.x) > collision_range_ ||
            std::fabs(b.center.y - p.y) > collision_range_ ||
            std::fabs(b.center.z - p.z) > collision_range_) {
            continue;
        }

        world::Aabb box = b.bounds();
        core::RegionId region = core::kNoRegion;

        if (strategy_ == core::SeamStrategy::RegionMerge && b.type == world::BlockType::Standard) {
            region = index.region_of(b.id);
            if (region != core::kNoRegion) {
                if (std::find(visited_regions_.begin(), visited_regions_.end(), region) != visited_regions_.end()) {
                    continue;
                }
                visited_regions_.push_back(region);
                box = index.region_bounds(region);
            }
        }

        const Vector3 closest{
            clampf(p.x, box.min.x, box.max.x),
            clampf(p.y, box.min.y, box.max.y),
            clampf(p.z, box.min.z, box.max.z),
        };
        const Vector3 d = Vector3Subtract(p, closest);
        const float dist_sq = d.x * d.x + d.y * d.y + d.z * d.z;

        if (!(dist_sq < r_sq && dist_sq > kMinDistSq)) continue;

        ++result.contacts;

        if (b.type == world::BlockType::Hazard) {
            result.hazard = true;
            if (observer_) observer_->on_hazard(b, p);
            if (on_hazard) on_hazard();
            return result;
        }

        const float dist = std::sqrt(dist_sq);
        const Vector3 normal = Vector3Scale(d, 1.0f / dist);
        const float penetration = r - dist;

        const float ax = std::fabs(normal.x);
        const float ay = std::fabs(normal.y);
        const float az = std::fabs(normal.z);

        // Landing on an internal edge looks exactly like this.
        const bool seam_like = player.velocity.y < 0.0f && ay < kSeamMaxNormalY &&
                               (ax > kSeamMinNormalXZ || az > kSeamMinNormalXZ);

        bool neighbor_seam = false;
        if (strategy_ == core::SeamStrategy::NeighborHeuristic && ay < kNeighborMaxNormalY) {
            neighbor_seam = has_standard_neighbor_(index, b, normal);
        }

        const bool resolved = !(seam_like || neighbor_seam);
        bool grounding = false;

        if (resolved) {
            p = Vector3Add(p, Vector3Scale(normal, penetration));

            // Cancel the inward component, no bounce. Only a contact moving into
            // an upward-facing surface grounds; one we are leaving does not.
            const float vn = Vector3DotProduct(player.velocity, normal);
            if (vn < 0.0f) {
                player.velocity = Vector3Add(player.velocity, Vector3Scale(normal, -vn));

                if (normal.y > kGroundNormalY) {
                    grounding = true;
                    result.grounded_contact = true;
                }
            }
            ++result.resolved;
        } else {
            ++result.suppressed;
        }

        if (observer_) {
            ContactReport report;
            report.call = calls_;
            report.block_id = b.id;
            report.grid = b.grid;
            report.block_type = b.type;
            report.position = p;
            report.velocity = player.velocity;
            report.closest = closest;
            report.normal = normal;
            report.dist_sq = dist_sq;
            report.penetration = penetration;
            report.region = region;
            report.region_merged = region != core::kNoRegion && index.region_size(region) > 1;
            report.box = box;
            report.seam_like = seam_like;
            report.neighbor_seam = neighbor_seam;
            report.resolved = resolved;
            report.grounding = grounding;
            observer_->on_contact(report);
        }
    }

    update_ground_state_(player, result.grounded_contact);
    return result;
}

} // namespace monotower::physics
