#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sim/boundary.hpp"

#include <string>

using namespace scorch;
using namespace scorch::sim;
using Catch::Matchers::WithinAbs;

constexpr f32 W = 1200.0f;
constexpr f32 H = 800.0f;

TEST_CASE("No edge behaviour leaves the state untouched", "[boundary]") {
    auto r = resolve_boundary(-5, -5, -3, -3, W, H, EdgeBehavior::None,
                              EdgeBehavior::None);
    CHECK_FALSE(r.hit);
    CHECK_FALSE(r.absorbed);
    CHECK(r.x == -5.0f);
    CHECK(r.vy == -3.0f);
}

TEST_CASE("Inside the world nothing triggers", "[boundary]") {
    auto r = resolve_boundary(600, 400, 5, 5, W, H, EdgeBehavior::Bounce,
                              EdgeBehavior::Bounce);
    CHECK_FALSE(r.hit);
    CHECK_FALSE(r.bounced);
}

TEST_CASE("Wall bounce reflects vx with restitution", "[boundary]") {
    auto left = resolve_boundary(-5, 300, -10, 2, W, H, EdgeBehavior::Bounce,
                                 EdgeBehavior::None);
    CHECK(left.hit);
    CHECK(left.bounced);
    CHECK_THAT(left.x, WithinAbs(0.0, 1e-6));
    CHECK_THAT(left.vx, WithinAbs(8.0, 1e-5));
    CHECK_THAT(left.vy, WithinAbs(2.0, 1e-6));

    auto right = resolve_boundary(1210, 300, 10, 2, W, H, EdgeBehavior::Bounce,
                                  EdgeBehavior::None);
    CHECK_THAT(right.x, WithinAbs(1200.0, 1e-6));
    CHECK_THAT(right.vx, WithinAbs(-8.0, 1e-5));
}

TEST_CASE("Wall wrap teleports to the opposite edge", "[boundary]") {
    auto left = resolve_boundary(-3, 300, -4, 0, W, H, EdgeBehavior::Wrap,
                                 EdgeBehavior::None);
    CHECK(left.hit);
    CHECK_FALSE(left.bounced);
    CHECK(left.x == W);
    CHECK(left.vx == -4.0f);

    auto right = resolve_boundary(1203, 300, 4, 0, W, H, EdgeBehavior::Wrap,
                                  EdgeBehavior::None);
    CHECK(right.x == 0.0f);
}

TEST_CASE("Ceiling bounce reflects vy", "[boundary]") {
    auto r = resolve_boundary(600, -4, 1, -6, W, H, EdgeBehavior::None,
                              EdgeBehavior::Bounce);
    CHECK(r.hit);
    CHECK(r.bounced);
    CHECK(r.y == 0.0f);
    CHECK_THAT(r.vy, WithinAbs(4.8, 1e-5));
}

TEST_CASE("Ceiling wrap re-enters heading down at half speed", "[boundary]") {
    auto r = resolve_boundary(600, -4, 1, -6, W, H, EdgeBehavior::None,
                              EdgeBehavior::Wrap);
    CHECK(r.hit);
    CHECK(r.x == 600.0f);
    CHECK(r.y == 0.0f);
    CHECK_THAT(r.vy, WithinAbs(3.0, 1e-6));
}

TEST_CASE("Absorb marks the projectile for removal", "[boundary]") {
    auto wall = resolve_boundary(1201, 300, 5, 0, W, H, EdgeBehavior::Absorb,
                                 EdgeBehavior::None);
    CHECK(wall.hit);
    CHECK(wall.absorbed);

    auto ceiling = resolve_boundary(600, -1, 0, -5, W, H, EdgeBehavior::None,
                                    EdgeBehavior::Absorb);
    CHECK(ceiling.absorbed);
}

TEST_CASE("Flying above the top is free without a ceiling mode", "[boundary]") {
    auto r = resolve_boundary(600, -50, 0, -5, W, H, EdgeBehavior::Bounce,
                              EdgeBehavior::None);
    CHECK_FALSE(r.hit);
    CHECK(r.y == -50.0f);
}

TEST_CASE("The floor is never a boundary", "[boundary]") {
    auto r = resolve_boundary(600, 900, 0, 5, W, H, EdgeBehavior::Bounce,
                              EdgeBehavior::Bounce);
    CHECK_FALSE(r.hit);
    CHECK(r.y == 900.0f);
}

TEST_CASE("Edge behaviour names parse case-insensitively", "[boundary]") {
    EdgeBehavior b = EdgeBehavior::None;
    CHECK(parse_edge_behavior("Bounce", b));
    CHECK(b == EdgeBehavior::Bounce);
    CHECK(parse_edge_behavior("ABSORB", b));
    CHECK(b == EdgeBehavior::Absorb);

    CHECK_FALSE(parse_edge_behavior("sticky", b));
    CHECK(b == EdgeBehavior::Absorb);

    CHECK(std::string(edge_behavior_name(EdgeBehavior::Wrap)) == "wrap");
}
