#include "collision_diagnostics.hpp"

#include <cmath>

namespace monotower::physics {

void LoggingCollisionObserver::on_contact(const ContactReport& r) {
    const float ax = std::fabs(r.normal.x);
    const float ay = std::fabs(r.normal.y);
    const float az = std::fabs(r.normal.z);
    const bool strong_horizontal = ay < 0.35f && (ax > 0.5f || az > 0.5f);

    if (!(r.seam_like || r.neighbor_seam || strong_horizontal)) return;

    if (has_logged_ && r.call - last_logged_call_ < static_cast<std::uint64_t>(cooldown_calls_)) return;
    has_logged_ = true;
    last_logged_call_ = r.call;
    ++logged_;

    TraceLog(LOG_DEBUG,
             "[coll] call=%llu block=%d,%d,%d(%s) pos=(%.3f,%.3f,%.3f) vel=(%.3f,%.3f,%.3f) "
             "normal=(%.3f,%.3f,%.3f) pen=%.4f distSq=%.4f merged=%d seamLike=%d neighborSeam=%d resolved=%d",
             static_cast<unsigned long long>(r.call),
             r.grid.gx, r.grid.gy, r.grid.gz, world::block_type_name(r.block_type),
             r.position.x, r.position.y, r.position.z,
             r.velocity.x, r.velocity.y, r.velocity.z,
             r.normal.x, r.normal.y, r.normal.z,
             r.penetration, r.dist_sq,
             r.region_merged ? 1 : 0, r.seam_like ? 1 : 0, r.neighbor_seam ? 1 : 0, r.resolved ? 1 : 0);
}

void LoggingCollisionObserver::on_hazard(const world::Block& block, const Vector3& position) {
    TraceLog(LOG_DEBUG, "[coll] hazard block=%d,%d,%d pos=(%.3f,%.3f,%.3f)",
             block.grid.gx, block.grid.gy, block.grid.gz, position.x, position.y, position.z);
}

} // namespace monotower::physics
