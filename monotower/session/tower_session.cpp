#include "tower_session.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <raylib.h>

namespace monotower::session {

const char* reset_reason_name(ResetReason r) {
    switch (r) {
        case ResetReason::Hazard: return "hazard";
        case ResetReason::FellOut: return "fell";
        case ResetReason::Manual: return "manual";
    }
    return "unknown";
}

TowerSession::TowerSession() = default;
TowerSession::~TowerSession() = default;

int TowerSession::score_for_height(float y, float block_size) {
    const float relative = y - block_size;
    const int blocks = static_cast<int>(std::floor(relative / block_size));
    return std::max(0, blocks);
}

bool TowerSession::init(const core::GameConfig& cfg, core::IRandomSource& rng, std::string* err) {
    std::string why;
    if (!core::validate_config(cfg, &why)) {
        TraceLog(LOG_ERROR, "[session] refusing to start: %s", why.c_str());
        if (err) *err = why;
        return false;
    }

    return init(cfg, world::LevelGenerator::generate(cfg, rng), err);
}

bool TowerSession::init(const core::GameConfig& cfg, world::Level level, std::string* err) {
    std::string why;
    if (!core::validate_config(cfg, &why)) {
        TraceLog(LOG_ERROR, "[session] refusing to start: %s", why.c_str());
        if (err) *err = why;
        return false;
    }
    if (!level.index.sealed()) {
        level.index.seal();
    }

    cfg_ = cfg;
    level_.emplace(std::move(level));

    integrator_ = std::make_unique<physics::Integrator>(cfg_.physics);
    resolver_ = std::make_unique<physics::CollisionResolver>(cfg_.physics);
    scheduler_ = std::make_unique<FixedStepScheduler>(cfg_.timing);

    if (cfg_.logging.collision_debug) {
        logging_observer_ = std::make_unique<physics::LoggingCollisionObserver>();
        resolver_->set_observer(logging_observer_.get());
    }

    player_ = physics::make_spawn_state(cfg_.session.spawn);
    input_ = InputState{};
    tick_ = 0;
    score_ = 0;
    status_.clear();
    status_clear_ticks_ = 0;
    victory_reported_ = false;
    resets_ = 0;

    TraceLog(LOG_INFO, "[session] started: blocks=%zu winHeight=%.1f timeStep=%.5f solver=%d seams=%s",
             level_->index.size(), level_->win_height, cfg_.timing.time_step,
             cfg_.physics.solver_iterations, core::seam_strategy_name(cfg_.physics.seam_strategy));

    publish_snapshot_();
    return true;
}

void TowerSession::set_collision_observer(physics::ICollisionObserver* observer) {
    if (resolver_) resolver_->set_observer(observer);
}

void TowerSession::clear_input() {
    const float yaw = input_.camera_yaw;
    input_ = InputState{};
    input_.camera_yaw = yaw;
}

int TowerSession::update(double now_seconds) {
    if (!initialized()) return 0;
    return scheduler_->advance(now_seconds, [this]() { step(); });
}

void TowerSession::emit_status_(std::string_view status) {
    status_.assign(status.data(), status.size());
    if (events_.onStatus) events_.onStatus(status);
}

void TowerSession::reset_player(ResetReason reason) {
    player_ = physics::make_spawn_state(cfg_.session.spawn);
    clear_input();
    victory_reported_ = false;
    ++resets_;

    TraceLog(LOG_INFO, "[session] tick=%llu reset (%s)", static_cast<unsigned long long>(tick_),
             reset_reason_name(reason));

    emit_status_(kStatusRespawned);
    const double clear_ticks = std::min(cfg_.session.status_clear_seconds / cfg_.timing.time_step,
                                        static_cast<double>(std::numeric_limits<int>::max()));
    status_clear_ticks_ = std::max(1, static_cast<int>(std::lround(clear_ticks)));

    if (events_.onReset) events_.onReset(reason);
}

void TowerSession::step() {
    if (!initialized()) return;

    ++tick_;

    if (status_clear_ticks_ > 0 && --status_clear_ticks_ == 0) {
        emit_status_(kStatusNone);
    }

    // 1. Input -> force
    const Vector3 force = compute_input_force(input_, cfg_.physics.move_speed);

    // 2. Integrate, then let penetration converge over several passes.
    integrator_->apply(player_, force);

    const physics::HazardCallback on_hazard = [this]() { reset_player(ResetReason::Hazard); };
    for (int i = 0; i < cfg_.physics.solver_iterations; ++i) {
        // A hazard already respawned the player; one reset per tick.
        if (resolver_->resolve(player_, level_->index, on_hazard).hazard) break;
    }

    // 3. Jump (consumes the request only when taken)
    if (input_.jump && player_.can_jump()) {
        player_.velocity.y = cfg_.physics.jump_force;
        player_.grounded = false;
        player_.coyote_timer = 0;
        input_.jump = false;
    }

    // 4. Fall-through and victory
    if (player_.position.y < cfg_.session.fall_floor) {
        reset_player(ResetReason::FellOut);
    }

    if (player_.position.y > level_->win_height && !victory_reported_) {
        victory_reported_ = true;
        status_clear_ticks_ = 0;
        TraceLog(LOG_INFO, "[session] tick=%llu victory at y=%.2f", static_cast<unsigned long long>(tick_),
                 player_.position.y);
        emit_status_(kStatusVictory);
    }

    // 5. Score
    score_ = score_for_height(player_.position.y, cfg_.physics.block_size);
    if (events_.onScore) events_.onScore(score_);

    publish_snapshot_();
}

void TowerSession::publish_snapshot_() {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    published_.player = player_;
    published_.score = score_;
    published_.tick = tick_;
    published_.status = status_;
    published_.victory = victory_reported_;
    published_.resets = resets_;
}

SessionSnapshot TowerSession::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return published_;
}

} // namespace monotower::session
