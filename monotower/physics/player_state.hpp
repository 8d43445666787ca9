#pragma once

#include <raylib.h>

namespace monotower::physics {

struct PlayerState {
    Vector3 position{0.0f, 0.0f, 0.0f};
    Vector3 velocity{0.0f, 0.0f, 0.0f};
    bool grounded{false};
    // Ticks of jump grace left after leaving the ground; in [0, coyote_frames].
    int coyote_timer{0};

    bool can_jump() const { return grounded || coyote_timer > 0; }
};

inline PlayerState make_spawn_state(const Vector3& spawn) {
    PlayerState s;
    s.position = spawn;
    return s;
}

} // namespace monotower::physics
