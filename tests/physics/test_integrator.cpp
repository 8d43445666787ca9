/**
 * @file test_integrator.cpp
 * @brief Unit tests for force, friction, gravity and speed clamping.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <monotower/physics/integrator.hpp>

#include <cmath>

using namespace monotower;
using namespace monotower::physics;
using Catch::Approx;

TEST_CASE("Integrator: order is force, friction, gravity, clamp, move", "[physics][integrator]") {
    const core::PhysicsConfig cfg;
    const Integrator integrator(cfg);

    PlayerState p;
    integrator.apply(p, Vector3{1.2f, 0.0f, 0.0f});

    REQUIRE(p.velocity.x == Approx(1.2f * 0.82f));
    REQUIRE(p.velocity.y == Approx(-0.65f));
    REQUIRE(p.velocity.z == Approx(0.0f));

    REQUIRE(p.position.x == Approx(p.velocity.x));
    REQUIRE(p.position.y == Approx(-0.65f));
}

TEST_CASE("Integrator: friction does not touch vertical velocity", "[physics][integrator]") {
    const core::PhysicsConfig cfg;
    const Integrator integrator(cfg);

    PlayerState p;
    p.velocity = Vector3{2.0f, 5.0f, -3.0f};
    integrator.apply(p, Vector3{0.0f, 0.0f, 0.0f});

    REQUIRE(p.velocity.x == Approx(2.0f * 0.82f));
    REQUIRE(p.velocity.y == Approx(5.0f - 0.65f));
    REQUIRE(p.velocity.z == Approx(-3.0f * 0.82f));
}

TEST_CASE("Integrator: horizontal speed is clamped, direction kept", "[physics][integrator]") {
    const core::PhysicsConfig cfg;
    const Integrator integrator(cfg);

    PlayerState p;
    p.velocity = Vector3{30.0f, 0.0f, 40.0f};
    integrator.apply(p, Vector3{0.0f, 0.0f, 0.0f});

    const float h = std::sqrt(p.velocity.x * p.velocity.x + p.velocity.z * p.velocity.z);
    REQUIRE(h == Approx(10.0f));
    REQUIRE(p.velocity.x / p.velocity.z == Approx(0.75f));
}

TEST_CASE("Integrator: vertical speed is never clamped", "[physics][integrator]") {
    const core::PhysicsConfig cfg;
    const Integrator integrator(cfg);

    PlayerState p;
    p.velocity = Vector3{0.0f, -50.0f, 0.0f};
    integrator.apply(p, Vector3{0.0f, 0.0f, 0.0f});

    REQUIRE(p.velocity.y == Approx(-50.65f));
    REQUIRE(p.position.y == Approx(-50.65f));
}

TEST_CASE("Integrator: grounded flags are left alone", "[physics][integrator]") {
    const core::PhysicsConfig cfg;
    const Integrator integrator(cfg);

    PlayerState p;
    p.grounded = true;
    p.coyote_timer = 3;
    integrator.apply(p, Vector3{0.0f, 0.0f, 0.0f});

    REQUIRE(p.grounded);
    REQUIRE(p.coyote_timer == 3);
}
