/**
 * @file test_fixed_step_scheduler.cpp
 * @brief Unit tests for the fixed-step accumulator and frame-delta clamp.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <monotower/session/fixed_step_scheduler.hpp>

#include "test_utils.hpp"

#include <cmath>

using namespace monotower;
using namespace monotower::session;
using Catch::Approx;

namespace {

core::TimingConfig default_timing() {
    test_helpers::silence_logging();
    return core::TimingConfig{};
}

} // namespace

TEST_CASE("Scheduler: first advance only latches the clock", "[session][scheduler]") {
    FixedStepScheduler sched(default_timing());
    int steps = 0;

    REQUIRE_FALSE(sched.started());
    REQUIRE(sched.advance(100.0, [&steps]() { ++steps; }) == 0);
    REQUIRE(sched.started());
    REQUIRE(steps == 0);
}

TEST_CASE("Scheduler: runs whole ticks and carries the remainder", "[session][scheduler]") {
    FixedStepScheduler sched(default_timing());
    int steps = 0;
    auto step = [&steps]() { ++steps; };

    sched.advance(0.0, step);
    REQUIRE(sched.advance(0.06, step) == 3);
    REQUIRE(steps == 3);
    REQUIRE(sched.accumulator() == Approx(0.01).margin(1e-9));
    REQUIRE(sched.alpha() == Approx(0.6).margin(1e-6));

    // 0.01 carried + 0.01 new > one tick.
    REQUIRE(sched.advance(0.07, step) == 1);
    REQUIRE(sched.total_ticks() == 4);
}

TEST_CASE("Scheduler: long stall runs at most the clamp worth of ticks", "[session][scheduler][clamp]") {
    FixedStepScheduler sched(default_timing());
    int steps = 0;
    auto step = [&steps]() { ++steps; };

    const int cap = static_cast<int>(std::floor(0.1 / (1.0 / 60.0) + 1e-9));
    REQUIRE(sched.max_ticks_per_advance() == cap);
    REQUIRE(cap == 6);

    sched.advance(0.0, step);
    const int ran = sched.advance(5.0, step);

    REQUIRE(ran <= cap);
    REQUIRE(ran >= cap - 1);
    REQUIRE(sched.clamped_frames() == 1);
    REQUIRE(sched.accumulator() < sched.time_step());

    // No catch-up on the following frame either.
    REQUIRE(sched.advance(5.0 + 1.0 / 120.0, step) <= 1);
}

TEST_CASE("Scheduler: clock going backwards counts as no time", "[session][scheduler]") {
    FixedStepScheduler sched(default_timing());
    int steps = 0;
    auto step = [&steps]() { ++steps; };

    sched.advance(10.0, step);
    REQUIRE(sched.advance(9.0, step) == 0);
    REQUIRE(sched.accumulator() == Approx(0.0));

    // The new, earlier timestamp is the reference from now on.
    REQUIRE(sched.advance(9.04, step) == 2);
}

TEST_CASE("Scheduler: steady frames track wall time", "[session][scheduler]") {
    FixedStepScheduler sched(default_timing());
    int steps = 0;
    auto step = [&steps]() { ++steps; };

    // Two simulated seconds at 144 Hz.
    for (int frame = 0; frame <= 288; ++frame) {
        sched.advance(static_cast<double>(frame) / 144.0, step);
    }

    REQUIRE(steps >= 119);
    REQUIRE(steps <= 120);
    REQUIRE(sched.clamped_frames() == 0);
}

TEST_CASE("Scheduler: reset forgets the clock", "[session][scheduler]") {
    FixedStepScheduler sched(default_timing());
    int steps = 0;
    auto step = [&steps]() { ++steps; };

    sched.advance(0.0, step);
    sched.advance(0.05, step);
    sched.reset();

    REQUIRE_FALSE(sched.started());
    REQUIRE(sched.accumulator() == Approx(0.0));
    REQUIRE(sched.advance(50.0, step) == 0);
}

TEST_CASE("Scheduler: custom rate and clamp", "[session][scheduler]") {
    core::TimingConfig timing = default_timing();
    timing.time_step = 1.0 / 30.0;
    timing.max_frame_delta = 0.25;

    FixedStepScheduler sched(timing);
    REQUIRE(sched.max_ticks_per_advance() == 7);

    int steps = 0;
    sched.advance(0.0, nullptr);
    REQUIRE(sched.advance(1.0, [&steps]() { ++steps; }) <= 7);
    REQUIRE(steps <= 7);
}
