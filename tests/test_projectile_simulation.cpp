#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "blueprints/weapon_catalog.hpp"
#include "map/terrain.hpp"
#include "sim/projectile_simulation.hpp"
#include "sim/tank.hpp"

#include <algorithm>

using namespace scorch;
using namespace scorch::sim;
using Catch::Matchers::WithinAbs;

namespace {

FireCommand shot(f32 x, f32 y, f32 angle, f32 power,
                 const std::string& weapon = "basic-shot") {
    FireCommand cmd;
    cmd.x = x;
    cmd.y = y;
    cmd.angle = angle;
    cmd.power = power;
    cmd.weapon_id = weapon;
    cmd.owner = 0;
    return cmd;
}

map::HeightmapTerrain flat_terrain() {
    return map::HeightmapTerrain(map::Heightmap::flat(1200, 600), 800.0f);
}

} // namespace

// ================================================================
// Firing
// ================================================================

TEST_CASE("Fire creates a flying projectile", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);

    auto* p = sim.fire(shot(100, 500, 45, 50, "missile"));
    REQUIRE(p != nullptr);
    CHECK(p->is_flying());
    CHECK(p->weapon().id == "missile");
    CHECK(p->owner() == 0);
    CHECK_FALSE(p->is_child());
    CHECK(sim.projectiles().size() == 1);
    CHECK_FALSE(sim.turn_complete());
    CHECK(sim.find(p->id()) == p);
}

TEST_CASE("Unknown weapon falls back to the basic shot", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);

    auto* p = sim.fire(shot(100, 500, 45, 50, "death-ray"));
    REQUIRE(p != nullptr);
    CHECK(p->weapon().id == "basic-shot");
}

TEST_CASE("Firing with an empty catalog does nothing", "[simulation]") {
    blueprints::WeaponCatalog catalog;
    ProjectileSimulation sim(PhysicsConfig{}, catalog);

    CHECK(sim.fire(shot(100, 500, 45, 50)) == nullptr);
    CHECK(sim.turn_complete());
}

// ================================================================
// Scenarios
// ================================================================

TEST_CASE("Vertical shot keeps its x and peaks once", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);
    std::vector<Tank*> tanks;

    sim.fire(shot(600, 700, 90, 50));

    f32 min_y = 700;
    f32 last_y = 700;
    bool rising = true;
    int direction_changes = 0;
    while (!sim.turn_complete() && sim.step_count() < 1000) {
        auto report = sim.step(DEFAULT_FRAME_MS, tanks);
        if (sim.turn_complete()) {
            REQUIRE(report.terminations.size() == 1);
            CHECK(report.terminations[0].reason == TerminationReason::OutOfBounds);
            CHECK(report.explosions.empty());
            break;
        }
        const auto& p = *sim.projectiles().front();
        CHECK_THAT(p.position().x, WithinAbs(600.0, 1e-3));
        if (rising && p.position().y > last_y) {
            rising = false;
            direction_changes++;
        }
        min_y = std::min(min_y, p.position().y);
        last_y = p.position().y;
    }

    CHECK(direction_changes == 1);
    CHECK(min_y < 460.0f);
}

TEST_CASE("Horizontal shot leaves on the right without exploding",
          "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);
    std::vector<Tank*> tanks;

    sim.fire(shot(0, 300, 0, 100));
    auto run = sim.run_to_completion(tanks);

    CHECK(run.completed);
    CHECK(run.report.explosions.empty());
    REQUIRE(run.report.terminations.size() == 1);
    CHECK(run.report.terminations[0].reason == TerminationReason::OutOfBounds);
    CHECK(run.report.terminations[0].position.x > 1200.0f);
}

TEST_CASE("Shell hits the enemy tank", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    auto terrain = flat_terrain();
    ProjectileSimulation sim(PhysicsConfig{}, catalog, &terrain);

    Tank enemy(2, 1, 400, 600);
    std::vector<Tank*> tanks{&enemy};

    sim.fire(shot(200, 560, 0, 50));
    auto run = sim.run_to_completion(tanks);

    CHECK(run.completed);
    CHECK(run.steps == 17);
    REQUIRE(run.report.terminations.size() == 1);
    CHECK(run.report.terminations[0].reason == TerminationReason::TankHit);
    REQUIRE(run.report.damage.size() == 1);
    CHECK(run.report.damage[0].tank == &enemy);
    CHECK(run.report.damage[0].attacker == 0);
    CHECK(enemy.health() == 75.0f);
}

TEST_CASE("MIRV children join after the split step", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    auto terrain = flat_terrain();
    ProjectileSimulation sim(PhysicsConfig{}, catalog, &terrain);
    std::vector<Tank*> tanks;

    auto* parent = sim.fire(shot(200, 500, 60, 50, "mirv"));
    u32 parent_id = parent->id();

    StepReport split_report;
    while (!sim.turn_complete() && sim.step_count() < 500) {
        auto report = sim.step(DEFAULT_FRAME_MS, tanks);
        if (!report.spawned.empty()) {
            split_report = std::move(report);
            break;
        }
    }

    REQUIRE(split_report.spawned.size() == 5);
    REQUIRE(split_report.terminations.size() == 1);
    CHECK(split_report.terminations[0].projectile_id == parent_id);
    CHECK(split_report.terminations[0].reason == TerminationReason::Split);
    CHECK(split_report.explosions.empty());

    // Parent gone, children in place at the split point and not yet moved
    CHECK(sim.find(parent_id) == nullptr);
    REQUIRE(sim.projectiles().size() == 5);
    auto split_at = split_report.terminations[0].position;
    for (const auto& child : sim.projectiles()) {
        CHECK(child->is_child());
        CHECK(child->position().x == split_at.x);
        CHECK(child->position().y == split_at.y);
        CHECK(child->trail().size() == 1);
    }

    auto rest = sim.run_to_completion(tanks);
    CHECK(rest.completed);
    CHECK(rest.report.spawned.empty());
    CHECK(rest.report.explosions.size() == 5);
}

TEST_CASE("Roller on flat ground times out after 3 seconds", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    auto terrain = flat_terrain();
    ProjectileSimulation sim(PhysicsConfig{}, catalog, &terrain);
    std::vector<Tank*> tanks;

    // Dropped straight down: no horizontal speed at impact
    sim.fire(shot(600, 590, 90, 0, "roller"));

    f64 landed_at = -1;
    while (!sim.turn_complete() && sim.step_count() < 1000) {
        sim.step(DEFAULT_FRAME_MS, tanks);
        if (landed_at < 0 && !sim.turn_complete() &&
            sim.projectiles().front()->is_rolling()) {
            landed_at = sim.sim_time_ms();
        }
    }

    REQUIRE(sim.turn_complete());
    REQUIRE(landed_at > 0);
    CHECK(sim.sim_time_ms() - landed_at >= 3000.0 - 1e-6);
}

TEST_CASE("Roller termination reports the timeout reason", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    auto terrain = flat_terrain();
    ProjectileSimulation sim(PhysicsConfig{}, catalog, &terrain);
    std::vector<Tank*> tanks;

    sim.fire(shot(600, 590, 90, 0, "roller"));
    auto run = sim.run_to_completion(tanks);

    REQUIRE(run.completed);
    REQUIRE(run.report.terminations.size() == 1);
    CHECK(run.report.terminations[0].reason == TerminationReason::Timeout);
    CHECK(run.report.explosions.size() == 1);
    CHECK(sim.sim_time_ms() >= 3000.0);
}

// ================================================================
// Turn control
// ================================================================

TEST_CASE("Clear cancels the turn", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);

    sim.fire(shot(100, 500, 45, 50));
    sim.fire(shot(200, 500, 45, 50));
    REQUIRE(sim.projectiles().size() == 2);

    sim.clear();
    CHECK(sim.turn_complete());
    CHECK(sim.projectiles().empty());
}

TEST_CASE("Physics config only changes between turns", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);

    PhysicsConfig heavy;
    heavy.gravity = 0.5f;

    sim.fire(shot(100, 500, 45, 50));
    CHECK_FALSE(sim.set_config(heavy));
    CHECK(sim.config().gravity == 0.2f);

    sim.clear();
    CHECK(sim.set_config(heavy));
    CHECK(sim.config().gravity == 0.5f);
}

TEST_CASE("Run stops at the step limit", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);
    std::vector<Tank*> tanks;

    sim.fire(shot(600, 700, 90, 50));
    auto run = sim.run_to_completion(tanks, DEFAULT_FRAME_MS, 5);

    CHECK_FALSE(run.completed);
    CHECK(run.steps == 5);
    CHECK(sim.projectiles().size() == 1);
    CHECK_THAT(sim.sim_time_ms(), WithinAbs(5 * DEFAULT_FRAME_MS, 1e-9));
}

TEST_CASE("Trail keeps the most recent positions", "[simulation]") {
    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    ProjectileSimulation sim(PhysicsConfig{}, catalog);
    std::vector<Tank*> tanks;

    auto* p = sim.fire(shot(100, 700, 60, 80));
    CHECK(p->trail().size() == 1);

    for (int i = 0; i < 30; i++) {
        sim.step(DEFAULT_FRAME_MS, tanks);
    }
    REQUIRE_FALSE(sim.turn_complete());
    const auto& trail = sim.projectiles().front()->trail();
    CHECK(trail.size() == Projectile::TRAIL_LENGTH);
    CHECK(trail.back().x == sim.projectiles().front()->position().x);
}
