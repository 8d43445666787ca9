#pragma once

#include "fixed_step_scheduler.hpp"
#include "input_state.hpp"

#include <monotower/core/config.hpp>
#include <monotower/core/random_source.hpp>
#include <monotower/physics/collision_resolver.hpp>
#include <monotower/physics/integrator.hpp>
#include <monotower/physics/player_state.hpp>
#include <monotower/world/level_generator.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace monotower::session {

inline constexpr std::string_view kStatusNone = "";
inline constexpr std::string_view kStatusRespawned = "RESPAWNED!";
inline constexpr std::string_view kStatusVictory = "VICTORY REACHED!";

enum class ResetReason : std::uint8_t {
    Hazard = 0,
    FellOut = 1,
    Manual = 2,
};

const char* reset_reason_name(ResetReason r);

// Outward events, invoked on the ticking thread.
struct SessionEvents {
    std::function<void(int)> onScore;
    std::function<void(std::string_view)> onStatus;
    std::function<void(ResetReason)> onReset;
};

// Copy of the session state taken at a tick boundary.
struct SessionSnapshot {
    physics::PlayerState player{};
    int score{0};
    core::Tick tick{0};
    std::string status{};
    bool victory{false};
    std::uint32_t resets{0};
};

// ============================================================================
// TowerSession - one player climbing one generated tower
// ============================================================================
//
// Each fixed tick: input force -> integrator -> N resolver passes -> jump ->
// fall/victory checks -> score -> snapshot publish. The level is immutable after
// init(); the player state is only touched by the ticking thread, other threads
// read it through snapshot().

class TowerSession {
public:
    TowerSession();
    ~TowerSession();

    TowerSession(const TowerSession&) = delete;
    TowerSession& operator=(const TowerSession&) = delete;

    /// Validates cfg and generates the level. Returns false (with err) on an invalid config.
    bool init(const core::GameConfig& cfg, core::IRandomSource& rng, std::string* err);

    /// Same, with a prebuilt level (sealed index).
    bool init(const core::GameConfig& cfg, world::Level level, std::string* err);

    bool initialized() const { return level_.has_value(); }

    void set_events(SessionEvents events) { events_ = std::move(events); }

    /// Latest movement intent. A true jump stays pending until a jump is possible.
    void set_input(const InputState& input) { input_ = input; }
    const InputState& input() const { return input_; }
    void clear_input();

    /// Driver entry point: runs the ticks due at now_seconds. Returns ticks run.
    int update(double now_seconds);

    /// Runs exactly one fixed tick.
    void step();

    /// Full overwrite of the player state back to spawn.
    void reset_player(ResetReason reason);

    SessionSnapshot snapshot() const;

    // --- Accessors (ticking thread) ---

    const core::GameConfig& config() const { return cfg_; }
    const world::Level& level() const { return *level_; }
    const physics::PlayerState& player() const { return player_; }
    physics::PlayerState& mutable_player() { return player_; }

    FixedStepScheduler& scheduler() { return *scheduler_; }
    physics::CollisionResolver& resolver() { return *resolver_; }

    /// Overrides the diagnostics sink (nullptr disables it).
    void set_collision_observer(physics::ICollisionObserver* observer);

    int score() const { return score_; }
    core::Tick tick() const { return tick_; }
    const std::string& status() const { return status_; }
    bool victory() const { return victory_reported_; }
    std::uint32_t resets() const { return resets_; }

    static int score_for_height(float y, float block_size);

private:
    void emit_status_(std::string_view status);
    void publish_snapshot_();

    core::GameConfig cfg_{};
    std::optional<world::Level> level_{};

    std::unique_ptr<physics::Integrator> integrator_{};
    std::unique_ptr<physics::CollisionResolver> resolver_{};
    std::unique_ptr<FixedStepScheduler> scheduler_{};
    std::unique_ptr<physics::LoggingCollisionObserver> logging_observer_{};

    physics::PlayerState player_{};
    InputState input_{};
    SessionEvents events_{};

    core::Tick tick_{0};
    int score_{0};
    std::string status_{};
    int status_clear_ticks_{0};
    bool victory_reported_{false};
    std::uint32_t resets_{0};

    mutable std::mutex snapshot_mutex_;
    SessionSnapshot published_{};
};

} // namespace monotower::session
