#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sim/trajectory.hpp"

#include <algorithm>
#include <string>

using namespace scorch;
using namespace scorch::sim;
using Catch::Matchers::WithinAbs;

// ================================================================
// Launch velocity
// ================================================================

TEST_CASE("Launch velocity points up for 90 degrees", "[trajectory]") {
    auto v = launch_velocity(90.0f, 100.0f, 20.0f);
    CHECK_THAT(v.x, WithinAbs(0.0, 1e-4));
    CHECK_THAT(v.y, WithinAbs(-20.0, 1e-4));
}

TEST_CASE("Launch velocity scales with power", "[trajectory]") {
    auto half = launch_velocity(0.0f, 50.0f, 20.0f);
    CHECK_THAT(half.x, WithinAbs(10.0, 1e-4));
    CHECK_THAT(half.y, WithinAbs(0.0, 1e-4));

    auto diag = launch_velocity(45.0f, 100.0f, 20.0f);
    CHECK_THAT(diag.x, WithinAbs(14.1421, 1e-3));
    CHECK_THAT(diag.y, WithinAbs(-14.1421, 1e-3));
}

TEST_CASE("Launch power is clamped to 0..100", "[trajectory]") {
    auto over = launch_velocity(0.0f, 150.0f, 20.0f);
    CHECK_THAT(over.x, WithinAbs(20.0, 1e-4));

    auto under = launch_velocity(0.0f, -10.0f, 20.0f);
    CHECK_THAT(under.x, WithinAbs(0.0, 1e-6));
}

// ================================================================
// Integration
// ================================================================

TEST_CASE("Integrate applies gravity before moving", "[trajectory]") {
    PhysicsConfig config;
    config.gravity = 0.2f;

    auto r = integrate({0, 0, 1, -1}, config);
    CHECK_THAT(r.state.vx, WithinAbs(1.0, 1e-6));
    CHECK_THAT(r.state.vy, WithinAbs(-0.8, 1e-6));
    CHECK_THAT(r.state.x, WithinAbs(1.0, 1e-6));
    CHECK_THAT(r.state.y, WithinAbs(-0.8, 1e-6));
    CHECK_FALSE(r.at_apex);
}

TEST_CASE("Integrate applies wind to vx", "[trajectory]") {
    PhysicsConfig config;
    config.wind_force = 0.05f;

    auto r = integrate({100, 100, 2, 0}, config);
    CHECK_THAT(r.state.vx, WithinAbs(2.05, 1e-5));
    CHECK_THAT(r.state.x, WithinAbs(102.05, 1e-4));
}

TEST_CASE("Speed cap rescales the velocity vector", "[trajectory]") {
    PhysicsConfig config;
    config.gravity = 0;
    config.max_speed = 5.0f;

    auto r = integrate({0, 0, 6, 8}, config);
    CHECK_THAT(r.state.vx, WithinAbs(3.0, 1e-5));
    CHECK_THAT(r.state.vy, WithinAbs(4.0, 1e-5));

    config.max_speed = 0;
    auto uncapped = integrate({0, 0, 6, 8}, config);
    CHECK_THAT(uncapped.state.vx, WithinAbs(6.0, 1e-5));
}

TEST_CASE("Apex is reported exactly once per arc", "[trajectory]") {
    PhysicsConfig config;
    auto v = launch_velocity(90.0f, 50.0f, config.max_velocity);
    KinematicState state{600, 700, v.x, v.y};

    int apex_count = 0;
    int apex_step = -1;
    f32 min_y = state.y;
    for (int step = 1; step <= 200; step++) {
        auto r = integrate(state, config);
        state = r.state;
        min_y = std::min(min_y, state.y);
        if (r.at_apex) {
            apex_count++;
            apex_step = step;
        }
    }

    CHECK(apex_count == 1);
    CHECK(apex_step >= 49);
    CHECK(apex_step <= 51);
    CHECK(min_y < 500.0f);
}

TEST_CASE("Every rising launch has exactly one apex", "[trajectory]") {
    f32 angle = GENERATE(take(20, random(1.0f, 179.0f)));
    f32 power = GENERATE(take(5, random(1.5f, 100.0f)));
    CAPTURE(angle, power);

    PhysicsConfig config;
    auto v = launch_velocity(angle, power, config.max_velocity);
    REQUIRE(v.y < 0);

    KinematicState state{600, 400, v.x, v.y};
    int apex_count = 0;
    for (int step = 0; step < 300; step++) {
        auto r = integrate(state, config);
        if (r.at_apex) apex_count++;
        state = r.state;
    }
    CHECK(apex_count == 1);
}

TEST_CASE("Falling projectile never reports apex", "[trajectory]") {
    PhysicsConfig config;
    KinematicState state{0, 0, 0, 0};
    for (int i = 0; i < 50; i++) {
        auto r = integrate(state, config);
        CHECK_FALSE(r.at_apex);
        state = r.state;
    }
}

// ================================================================
// Out of bounds
// ================================================================

TEST_CASE("Out of bounds edges", "[trajectory]") {
    CHECK(out_of_bounds(-0.1f, 10, 1200, 800) == OutOfBoundsEdge::Left);
    CHECK(out_of_bounds(1200.1f, 10, 1200, 800) == OutOfBoundsEdge::Right);
    CHECK(out_of_bounds(600, 800.1f, 1200, 800) == OutOfBoundsEdge::Bottom);

    // Edges themselves are inside, and so is everything above the top
    CHECK(out_of_bounds(0, 0, 1200, 800) == OutOfBoundsEdge::None);
    CHECK(out_of_bounds(1200, 800, 1200, 800) == OutOfBoundsEdge::None);
    CHECK(out_of_bounds(600, -500, 1200, 800) == OutOfBoundsEdge::None);
}

TEST_CASE("Horizontal shot leaves through the right edge", "[trajectory]") {
    PhysicsConfig config;
    auto v = launch_velocity(0.0f, 100.0f, config.max_velocity);
    KinematicState state{0, 300, v.x, v.y};

    OutOfBoundsEdge edge = OutOfBoundsEdge::None;
    int steps = 0;
    while (edge == OutOfBoundsEdge::None && steps < 1000) {
        state = integrate(state, config).state;
        edge = out_of_bounds(state.x, state.y, config.world_width,
                             config.world_height);
        steps++;
    }

    CHECK(edge == OutOfBoundsEdge::Right);
    CHECK(state.x > 1200.0f);
    CHECK(steps == 61);
    CHECK(std::string(out_of_bounds_edge_name(edge)) == "right");
}
