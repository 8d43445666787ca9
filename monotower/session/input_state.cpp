#include "input_state.hpp"

#include <cmath>

#include <raymath.h>

namespace monotower::session {

Vector3 compute_input_force(const InputState& input, float move_speed) {
    if (!input.has_move_intent()) {
        return Vector3{0.0f, 0.0f, 0.0f};
    }

    // Flattened view direction and its right-hand perpendicular.
    const Vector3 view{-std::sin(input.camera_yaw), 0.0f, -std::cos(input.camera_yaw)};
    const Vector3 right{-view.z, 0.0f, view.x};

    const Vector3 dir = Vector3Add(Vector3Scale(view, input.forward), Vector3Scale(right, input.right));
    const float len = Vector3Length(dir);
    if (len <= 0.0f) {
        return Vector3{0.0f, 0.0f, 0.0f};
    }

    return Vector3Scale(dir, move_speed / len);
}

} // namespace monotower::session
