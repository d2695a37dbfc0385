#include "sim/projectile_simulation.hpp"

#include "blueprints/weapon_catalog.hpp"
#include "sim/trajectory.hpp"
#include "sim/weapon_behavior.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace scorch::sim {

ProjectileSimulation::ProjectileSimulation(
    PhysicsConfig config, const blueprints::WeaponCatalog& catalog,
    map::Terrain* terrain)
    : config_(config), catalog_(catalog), terrain_(terrain) {}

Projectile* ProjectileSimulation::fire(const FireCommand& command) {
    auto weapon = catalog_.find_shared(command.weapon_id);
    if (!weapon) {
        weapon = catalog_.default_weapon();
        if (!weapon) {
            spdlog::error("Cannot fire '{}': weapon catalog is empty",
                          command.weapon_id);
            return nullptr;
        }
        spdlog::warn("Unknown weapon '{}', firing '{}' instead",
                     command.weapon_id, weapon->id);
    }

    Vector2 velocity = launch_velocity(command.angle, command.power,
                                       config_.max_velocity);
    u32 id = next_projectile_id_++;
    projectiles_.push_back(std::make_unique<Projectile>(
        id, command.owner, std::move(weapon), Vector2{command.x, command.y},
        velocity));

    auto* p = projectiles_.back().get();
    spdlog::debug("Owner {} fired '{}' as projectile #{} (angle={:.1f}, "
                  "power={:.1f}, v=({:.2f}, {:.2f}))",
                  command.owner, p->weapon().id, id, command.angle,
                  command.power, velocity.x, velocity.y);
    return p;
}

StepReport ProjectileSimulation::step(f64 dt_ms,
                                      const std::vector<Tank*>& tanks) {
    StepReport report;
    sim_time_ms_ += dt_ms;
    step_count_++;

    std::vector<std::unique_ptr<Projectile>> spawned;
    StepContext ctx{config_, terrain_, tanks, sim_time_ms_,
                    next_projectile_id_, report, spawned};

    // Only projectiles present before the pass move this step
    size_t live_count = projectiles_.size();
    for (size_t i = 0; i < live_count; i++) {
        auto& p = *projectiles_[i];
        if (!p.active()) continue;
        advance_projectile(p, ctx);
    }

    std::erase_if(projectiles_, [](const std::unique_ptr<Projectile>& p) {
        return !p->active();
    });
    for (auto& child : spawned) {
        projectiles_.push_back(std::move(child));
    }

    if (!report.explosions.empty() && projectiles_.empty()) {
        spdlog::info("Turn complete after {} steps ({:.0f} ms)", step_count_,
                     sim_time_ms_);
    }
    return report;
}

void ProjectileSimulation::clear() {
    if (!projectiles_.empty()) {
        spdlog::debug("Cancelling {} live projectile(s)", projectiles_.size());
    }
    for (auto& p : projectiles_) {
        p->deactivate(TerminationReason::Cancelled);
    }
    projectiles_.clear();
}

RunResult ProjectileSimulation::run_to_completion(
    const std::vector<Tank*>& tanks, f64 dt_ms, u32 max_steps) {
    RunResult result;
    while (!turn_complete() && result.steps < max_steps) {
        auto report = step(dt_ms, tanks);
        result.steps++;

        auto append = [](auto& into, auto& from) {
            into.insert(into.end(), std::make_move_iterator(from.begin()),
                        std::make_move_iterator(from.end()));
        };
        append(result.report.explosions, report.explosions);
        append(result.report.damage, report.damage);
        append(result.report.terminations, report.terminations);
        append(result.report.spawned, report.spawned);
    }
    result.completed = turn_complete();
    if (!result.completed) {
        spdlog::warn("Step limit {} reached with {} projectile(s) in flight",
                     max_steps, projectiles_.size());
    }
    return result;
}

Projectile* ProjectileSimulation::find(u32 id) const {
    auto it = std::find_if(projectiles_.begin(), projectiles_.end(),
                           [id](const auto& p) { return p->id() == id; });
    return it != projectiles_.end() ? it->get() : nullptr;
}

bool ProjectileSimulation::set_config(const PhysicsConfig& config) {
    if (!turn_complete()) {
        spdlog::warn("Physics config change ignored: {} projectile(s) in flight",
                     projectiles_.size());
        return false;
    }
    config_ = config;
    return true;
}

} // namespace scorch::sim
