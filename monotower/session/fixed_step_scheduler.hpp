#pragma once

#include <monotower/core/config.hpp>
#include <monotower/core/types.hpp>

#include <functional>

namespace monotower::session {

// ============================================================================
// FixedStepScheduler - converts wall-clock frames into fixed logical ticks
// ============================================================================
//
// - The first advance() only latches the timestamp and runs no tick.
// - Each frame delta is clamped to max_frame_delta before accumulation, so one
//   advance() runs at most floor(max_frame_delta / time_step) ticks.
// - A timestamp that goes backwards counts as a zero delta.

class FixedStepScheduler {
public:
    using StepFn = std::function<void()>;

    explicit FixedStepScheduler(const core::TimingConfig& cfg);

    /// Feeds the current time (seconds, monotonic) and runs the due ticks.
    /// Returns the number of ticks executed.
    int advance(double now_seconds, const StepFn& step);

    /// Forgets the timestamp and any accumulated time.
    void reset();

    bool started() const { return started_; }
    double time_step() const { return time_step_; }
    double max_frame_delta() const { return max_frame_delta_; }
    int max_ticks_per_advance() const { return max_ticks_; }

    double accumulator() const { return accumulator_; }
    core::Tick total_ticks() const { return total_ticks_; }
    std::uint64_t clamped_frames() const { return clamped_frames_; }

    // Fraction of a tick left in the accumulator, for render interpolation.
    double alpha() const { return accumulator_ / time_step_; }

private:
    double time_step_{1.0 / 60.0};
    double max_frame_delta_{0.1};
    int max_ticks_{6};

    bool started_{false};
    double last_time_{0.0};
    double accumulator_{0.0};

    core::Tick total_ticks_{0};
    std::uint64_t clamped_frames_{0};
};

} // namespace monotower::session
