#pragma once

#include "map/terrain.hpp"
#include "sim/geometry.hpp"

#include <vector>

namespace scorch::sim {

class Tank;

struct ExplosionRequest {
    Vector2 epicenter;
    f32 radius = 0;
    f32 damage = 0;                  ///< Damage at the epicenter
    f32 direct_hit_multiplier = 1.5f;
    Tank* direct_hit_tank = nullptr; ///< Set by the collision step, may be null
    map::DeformKind terrain_effect = map::DeformKind::Explosion;
    i32 attacker = -1;               ///< Owner of the projectile, for rewards
};

struct DamageEvent {
    Tank* tank = nullptr;
    f32 damage = 0;        ///< Computed damage
    f32 actual_damage = 0; ///< What the tank's health actually lost
    bool was_direct_hit = false;
    i32 attacker = -1;
};

struct ExplosionOutcome {
    bool terrain_deformed = false;
    std::vector<DamageEvent> damage;
};

/// Linear falloff: round(damage * (1 - distance / radius)), at least 1
/// inside the radius, 0 at or beyond it (and for harmless weapons).
f32 falloff_damage(f32 weapon_damage, f32 distance, f32 radius);

/// Direct hits skip falloff: round(damage * multiplier).
f32 direct_hit_damage(f32 weapon_damage, f32 multiplier);

/// Deform the terrain once at the epicenter, then damage every live tank in
/// range. Distances are measured to the nearest edge of each tank's box.
/// Tanks are mutated through Tank::apply_damage; money and score are left
/// to the caller. A null terrain skips the deformation.
ExplosionOutcome resolve_explosion(const ExplosionRequest& request,
                                   map::Terrain* terrain,
                                   const std::vector<Tank*>& tanks);

} // namespace scorch::sim
