#include "integrator.hpp"

#include <cmath>

#include <raymath.h>

namespace monotower::physics {

Integrator::Integrator(const core::PhysicsConfig& cfg)
    : friction_(cfg.friction)
    , gravity_(cfg.gravity)
    , max_speed_(cfg.max_speed) {
}

void Integrator::apply(PlayerState& player, const Vector3& input_force) const {
    Vector3& vel = player.velocity;

    vel = Vector3Add(vel, input_force);

    vel.x *= friction_;
    vel.z *= friction_;

    vel.y -= gravity_;

    // Horizontal only; vertical speed is never clamped.
    const float h_speed = std::sqrt(vel.x * vel.x + vel.z * vel.z);
    if (h_speed > max_speed_) {
        const float ratio = max_speed_ / h_speed;
        vel.x *= ratio;
        vel.z *= ratio;
    }

    player.position = Vector3Add(player.position, vel);
}

} // namespace monotower::physics
