#include "fixed_step_scheduler.hpp"

#include <algorithm>
#include <cmath>

#include <raylib.h>

namespace monotower::session {

FixedStepScheduler::FixedStepScheduler(const core::TimingConfig& cfg)
    : time_step_(cfg.time_step)
    , max_frame_delta_(cfg.max_frame_delta) {
    // Small bias so 0.1 / (1/60) lands on 6 rather than 5.999...
    max_ticks_ = std::max(1, static_cast<int>(std::floor(max_frame_delta_ / time_step_ + 1e-9)));
}

void FixedStepScheduler::reset() {
    started_ = false;
    last_time_ = 0.0;
    accumulator_ = 0.0;
}

int FixedStepScheduler::advance(double now_seconds, const StepFn& step) {
    if (!started_) {
        started_ = true;
        last_time_ = now_seconds;
        return 0;
    }

    double delta = now_seconds - last_time_;
    last_time_ = now_seconds;

    if (delta < 0.0) delta = 0.0;
    if (delta > max_frame_delta_) {
        delta = max_frame_delta_;
        ++clamped_frames_;
    }

    accumulator_ += delta;

    int ticks = 0;
    while (accumulator_ >= time_step_ && ticks < max_ticks_) {
        if (step) step();
        accumulator_ -= time_step_;
        ++ticks;
    }

    // Rounding leftovers must not carry a backlog into the next frame.
    if (accumulator_ >= time_step_) {
        TraceLog(LOG_DEBUG, "[sched] dropping %.6fs backlog after %d ticks", accumulator_, ticks);
        accumulator_ = std::fmod(accumulator_, time_step_);
    }

    total_ticks_ += static_cast<core::Tick>(ticks);
    return ticks;
}

} // namespace monotower::session
