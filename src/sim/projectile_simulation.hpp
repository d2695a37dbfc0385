#pragma once

#include "sim/physics_config.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_events.hpp"

#include <memory>
#include <string>
#include <vector>

namespace scorch::blueprints {
class WeaponCatalog;
}

namespace scorch::map {
class Terrain;
}

namespace scorch::sim {

class Tank;

/// One frame at 60 fps.
constexpr f64 DEFAULT_FRAME_MS = 1000.0 / 60.0;

struct FireCommand {
    f32 x = 0, y = 0;    ///< Muzzle position
    f32 angle = 45.0f;   ///< Degrees CCW from +X
    f32 power = 50.0f;   ///< 0..100
    std::string weapon_id;
    i32 owner = -1;
};

/// Result of run_to_completion(): every step's events merged in order.
struct RunResult {
    u32 steps = 0;
    bool completed = false; ///< False when the step limit was reached first
    StepReport report;
};

/// Owns the projectiles of the current turn and steps them frame by frame.
/// Terrain and tanks belong to the caller.
class ProjectileSimulation {
public:
    ProjectileSimulation(PhysicsConfig config,
                         const blueprints::WeaponCatalog& catalog,
                         map::Terrain* terrain = nullptr);

    /// Launch a projectile. Unknown weapon ids fall back to the catalog's
    /// default weapon. Returns null only when the catalog is empty.
    Projectile* fire(const FireCommand& command);

    /// Advance the clock by dt_ms and every projectile live at the start of
    /// the step by one frame. Children spawned during the step join the set
    /// afterwards and first move on the next step.
    StepReport step(f64 dt_ms, const std::vector<Tank*>& tanks);

    bool turn_complete() const { return projectiles_.empty(); }

    /// Cancel the turn: every live projectile is dropped without exploding.
    void clear();

    RunResult run_to_completion(const std::vector<Tank*>& tanks,
                                f64 dt_ms = DEFAULT_FRAME_MS,
                                u32 max_steps = 10000);

    const std::vector<std::unique_ptr<Projectile>>& projectiles() const {
        return projectiles_;
    }
    Projectile* find(u32 id) const;

    f64 sim_time_ms() const { return sim_time_ms_; }
    u64 step_count() const { return step_count_; }

    const PhysicsConfig& config() const { return config_; }
    /// Only allowed between turns; returns false while projectiles are live.
    bool set_config(const PhysicsConfig& config);

    map::Terrain* terrain() const { return terrain_; }
    void set_terrain(map::Terrain* terrain) { terrain_ = terrain; }

private:
    PhysicsConfig config_;
    const blueprints::WeaponCatalog& catalog_;
    map::Terrain* terrain_;

    std::vector<std::unique_ptr<Projectile>> projectiles_;
    u32 next_projectile_id_ = 1;
    f64 sim_time_ms_ = 0;
    u64 step_count_ = 0;
};

} // namespace scorch::sim
