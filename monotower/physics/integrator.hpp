#pragma once

#include "player_state.hpp"

#include <monotower/core/config.hpp>

#include <raylib.h>

namespace monotower::physics {

// Unconstrained integration step, run once per tick before collision passes.
// Units are per tick: velocity is added to position directly.
class Integrator {
public:
    explicit Integrator(const core::PhysicsConfig& cfg);

    /// Order: input force, horizontal friction, gravity, horizontal speed clamp, position.
    void apply(PlayerState& player, const Vector3& input_force) const;

private:
    float friction_{0.82f};
    float gravity_{0.65f};
    float max_speed_{10.0f};
};

} // namespace monotower::physics
