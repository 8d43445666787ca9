#pragma once

#include <raylib.h>

namespace monotower::session {

// Movement intent for the next tick, already mapped from keys/touch by the driver.
struct InputState {
    // [-1, 1]; +forward is away from the camera, +right is screen right.
    float forward{0.0f};
    float right{0.0f};
    bool jump{false};

    // Orbit camera yaw (radians). The camera sits at player + (sin, _, cos) * offset.
    float camera_yaw{0.0f};

    bool has_move_intent() const { return forward != 0.0f || right != 0.0f; }
};

/// Camera-relative horizontal force of magnitude move_speed (zero without intent).
Vector3 compute_input_force(const InputState& input, float move_speed);

} // namespace monotower::session
