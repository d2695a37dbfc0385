#include "core/log.hpp"
#include "core/types.hpp"
#include "blueprints/weapon_catalog.hpp"
#include "lua/config_loader.hpp"
#include "map/terrain.hpp"
#include "sim/projectile_simulation.hpp"
#include "sim/tank.hpp"
#include "sim/trajectory_preview.hpp"
#include "sim/wind.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <random>
#include <spdlog/spdlog.h>

namespace {

struct CliOptions {
    scorch::fs::path config_file;
    std::string weapon_id = scorch::blueprints::DEFAULT_WEAPON_ID;
    scorch::f32 angle = 45.0f;
    scorch::f32 power = 60.0f;
    std::optional<scorch::f32> wind;
    scorch::u32 round = 1;
    scorch::u32 max_steps = 10000;
    std::string log_level;
    bool list_weapons = false;
};

void print_usage() {
    std::cout << "Scorch v0.1.0\n"
              << "Headless artillery duel: fires one shot and reports what it hit\n\n"
              << "Usage:\n"
              << "  scorch [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Lua config script (Physics{}, WeaponBlueprint{})\n"
              << "  --weapon <id>      Weapon to fire (default: basic-shot)\n"
              << "  --angle <deg>      Launch angle, 90 = straight up (default: 45)\n"
              << "  --power <0-100>    Launch power (default: 60)\n"
              << "  --wind <value>     Wind, -12..12 (default: random for the round)\n"
              << "  --round <n>        Round number for the wind range (default: 1)\n"
              << "  --steps <n>        Step limit (default: 10000)\n"
              << "  --log <level>      trace, debug, info, warn, error, off\n"
              << "  --list-weapons     Print the weapon catalog and exit\n"
              << "  --help             Show this help message\n";
}

bool parse_number(const char* text, scorch::f32& out) {
    char* end = nullptr;
    double v = std::strtod(text, &end);
    if (end == text || *end != '\0') return false;
    out = static_cast<scorch::f32>(v);
    return true;
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    auto number_arg = [&](int& i, scorch::f32& out) {
        if (i + 1 >= argc || !parse_number(argv[i + 1], out)) {
            spdlog::error("{} expects a number", argv[i]);
            return false;
        }
        i++;
        return true;
    };

    for (int i = 1; i < argc; i++) {
        scorch::f32 value = 0;
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--weapon") == 0 && i + 1 < argc) {
            opts.weapon_id = argv[++i];
        } else if (std::strcmp(argv[i], "--angle") == 0) {
            if (!number_arg(i, opts.angle)) return std::nullopt;
        } else if (std::strcmp(argv[i], "--power") == 0) {
            if (!number_arg(i, opts.power)) return std::nullopt;
        } else if (std::strcmp(argv[i], "--wind") == 0) {
            if (!number_arg(i, value)) return std::nullopt;
            opts.wind = value;
        } else if (std::strcmp(argv[i], "--round") == 0) {
            if (!number_arg(i, value) || value < 1) return std::nullopt;
            opts.round = static_cast<scorch::u32>(value);
        } else if (std::strcmp(argv[i], "--steps") == 0) {
            if (!number_arg(i, value) || value < 1) return std::nullopt;
            opts.max_steps = static_cast<scorch::u32>(value);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--list-weapons") == 0) {
            opts.list_weapons = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            spdlog::error("Unknown option: {}", argv[i]);
            return std::nullopt;
        }
    }
    return opts;
}

/// Rolling hills built from two sine waves, kept inside the lower half of
/// the world.
scorch::map::Heightmap make_hills(scorch::u32 width, scorch::f32 world_height) {
    std::vector<scorch::f32> surface(width + 1);
    scorch::f32 base = world_height * 0.7f;
    for (scorch::u32 x = 0; x <= width; x++) {
        scorch::f32 fx = static_cast<scorch::f32>(x);
        surface[x] = base + 40.0f * std::sin(fx * 0.008f) +
                     15.0f * std::sin(fx * 0.031f + 1.3f);
    }
    return scorch::map::Heightmap(width, std::move(surface));
}

void list_weapons(const scorch::blueprints::WeaponCatalog& catalog) {
    for (const auto* def : catalog.get_all()) {
        std::cout << def->id << "  " << def->name << "  ["
                  << scorch::blueprints::weapon_kind_name(def->kind())
                  << "]  damage=" << def->damage
                  << " radius=" << def->blast_radius << " cost=" << def->cost
                  << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace scorch;

    scorch::log::init();

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 1;
    }
    const auto& opts = *parsed;
    if (!opts.log_level.empty() && !scorch::log::set_level(opts.log_level)) {
        return 1;
    }

    auto catalog = blueprints::WeaponCatalog::with_builtin_weapons();
    sim::PhysicsConfig physics;

    if (!opts.config_file.empty()) {
        lua::ConfigLoader loader(catalog, physics);
        auto result = loader.load_file(opts.config_file);
        if (!result) {
            spdlog::error("Config failed: {}", result.error().describe());
            scorch::log::shutdown();
            return 1;
        }
    }
    catalog.log_statistics();

    if (opts.list_weapons) {
        list_weapons(catalog);
        scorch::log::shutdown();
        return 0;
    }

    // --wind wins over the config script; a calm config gets random wind
    f32 wind = physics.wind_force / sim::WIND_FORCE_MULTIPLIER;
    if (opts.wind) {
        wind = *opts.wind;
    } else if (physics.wind_force == 0) {
        std::mt19937 rng(std::random_device{}());
        wind = sim::generate_wind(rng, sim::wind_range_for_round(opts.round));
    }
    physics.wind_force = sim::wind_force(wind);
    spdlog::info("Round {}: wind {:.1f} ({})", opts.round, wind,
                 sim::wind_direction_text(wind));

    auto width = static_cast<u32>(physics.world_width);
    map::HeightmapTerrain terrain(make_hills(width, physics.world_height),
                                  physics.world_height);

    f32 left_x = physics.world_width * 0.15f;
    f32 right_x = physics.world_width * 0.85f;
    sim::Tank player(1, 0, left_x, terrain.get_height(left_x));
    sim::Tank enemy(2, 1, right_x, terrain.get_height(right_x));
    player.set_name("Player");
    enemy.set_name("Enemy");
    std::vector<sim::Tank*> tanks{&player, &enemy};

    // Just above the hull so the shell does not start inside its own tank
    sim::Vector2 muzzle{player.position().x,
                        player.position().y - sim::Tank::HEIGHT - 2.0f};

    auto preview = sim::preview_trajectory(physics, &terrain, tanks, muzzle,
                                           opts.angle, opts.power);
    spdlog::info("Preview: {} after {} steps at ({:.1f}, {:.1f})",
                 sim::preview_outcome_name(preview.outcome), preview.steps,
                 preview.landing.x, preview.landing.y);

    sim::ProjectileSimulation simulation(physics, catalog, &terrain);
    sim::FireCommand command;
    command.x = muzzle.x;
    command.y = muzzle.y;
    command.angle = opts.angle;
    command.power = opts.power;
    command.weapon_id = opts.weapon_id;
    command.owner = player.owner();

    if (!simulation.fire(command)) {
        scorch::log::shutdown();
        return 1;
    }

    auto run = simulation.run_to_completion(tanks, sim::DEFAULT_FRAME_MS,
                                            opts.max_steps);

    for (const auto& boom : run.report.explosions) {
        spdlog::info("Explosion: '{}' at ({:.1f}, {:.1f}) radius {:.0f}{}",
                     boom.weapon->id, boom.epicenter.x, boom.epicenter.y,
                     boom.radius, boom.direct_hit_tank ? " (direct hit)" : "");
    }
    for (const auto& hit : run.report.damage) {
        spdlog::info("  {} took {:.0f} damage{}", hit.tank->name(),
                     hit.actual_damage, hit.was_direct_hit ? " (direct)" : "");
        if (hit.attacker == player.owner() && hit.tank != &player) {
            player.add_score(static_cast<i32>(hit.actual_damage));
        }
    }

    spdlog::info("Shot finished after {} steps ({:.0f} ms){}", run.steps,
                 simulation.sim_time_ms(),
                 run.completed ? "" : ", step limit reached");
    spdlog::info("{}: health {:.0f}, score {}", player.name(), player.health(),
                 player.score());
    spdlog::info("{}: health {:.0f}{}", enemy.name(), enemy.health(),
                 enemy.destroyed() ? " (destroyed)" : "");

    scorch::log::shutdown();
    return run.completed ? 0 : 2;
}
