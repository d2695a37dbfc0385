#pragma once

#include "blueprints/weapon_def.hpp"
#include "sim/explosion.hpp"
#include "sim/projectile.hpp"

#include <memory>
#include <vector>

namespace scorch::sim {

/// One detonation, for effects, sound and camera shake.
struct ExplosionEvent {
    u32 projectile_id = 0;
    i32 owner = -1;
    Vector2 epicenter;
    f32 radius = 0;
    f32 damage = 0;
    std::shared_ptr<const blueprints::WeaponDef> weapon;
    Tank* direct_hit_tank = nullptr;
    map::DeformKind terrain_effect = map::DeformKind::Explosion;
    blueprints::VisualFlags visuals;
    TerminationReason reason = TerminationReason::TerrainHit;
};

struct TerminationEvent {
    u32 projectile_id = 0;
    TerminationReason reason = TerminationReason::Cancelled;
    Vector2 position;
};

/// Everything that happened during one simulation step.
struct StepReport {
    std::vector<ExplosionEvent> explosions;
    std::vector<DamageEvent> damage;
    std::vector<TerminationEvent> terminations;
    std::vector<u32> spawned; ///< Ids of split children created this step

    bool empty() const {
        return explosions.empty() && damage.empty() && terminations.empty() &&
               spawned.empty();
    }
};

} // namespace scorch::sim
