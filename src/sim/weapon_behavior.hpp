#pragma once

#include "sim/physics_config.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_events.hpp"

#include <memory>
#include <vector>

namespace scorch::map {
class Terrain;
}

namespace scorch::sim {

class Tank;

// Splitting
constexpr f32 SPLIT_SPEED_FACTOR = 0.8f;
constexpr f32 MIN_CHILD_SPEED = 5.0f;
constexpr f32 MIN_CHILD_DOWNWARD_VY = 1.0f;

// Rolling
constexpr f32 MIN_ROLL_SPEED = 0.5f;
constexpr f32 MAX_ROLL_SPEED = 8.0f;
constexpr f32 ROLL_LOOKAHEAD = 5.0f;
constexpr f32 ROLL_GRAVITY = 0.3f;
constexpr f32 ROLL_IMPACT_FACTOR = 0.5f;
constexpr f32 VALLEY_THRESHOLD = 0.5f;  ///< Height rise ahead that counts as uphill
constexpr f32 ROLL_CONTACT_HEIGHT = 2.0f; ///< Tank contact probe above the surface
constexpr f32 ROLLER_RADIUS = 4.0f;

// Digging
constexpr f32 MIN_TUNNEL_SPEED = 2.0f;

/// Per-step context handed to the behaviour engine.
struct StepContext {
    const PhysicsConfig& config;
    map::Terrain* terrain;            ///< May be null (dry run)
    const std::vector<Tank*>& tanks;
    f64 now_ms;                       ///< Simulation clock for this step
    u32& next_projectile_id;
    StepReport& report;
    /// Children created this step; merged by the caller after the pass.
    std::vector<std::unique_ptr<Projectile>>& spawned;
};

/// Advance one live projectile by one step according to its motion state
/// and weapon behaviour. Inactive projectiles are left untouched.
void advance_projectile(Projectile& projectile, StepContext& ctx);

/// Launch angles (degrees, absolute) for split children: the parent's
/// travel direction plus offsets evenly spread over `spread_deg` and
/// centred on zero. A single child keeps the parent's direction.
std::vector<f32> split_directions(f32 parent_vx, f32 parent_vy, u32 count,
                                  f32 spread_deg);

/// max(0.8 * |vx|, 0.8 * speed, 5).
f32 split_child_speed(f32 parent_vx, f32 parent_speed);

/// Spawn children if this is the projectile's split moment. Returns true
/// (and deactivates the parent) only for a non-child splitting weapon that
/// has not split yet.
bool try_split(Projectile& projectile, StepContext& ctx);

} // namespace scorch::sim
