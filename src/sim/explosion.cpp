#include "sim/explosion.hpp"
#include "sim/collision.hpp"
#include "sim/tank.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace scorch::sim {

f32 falloff_damage(f32 weapon_damage, f32 distance, f32 radius) {
    if (weapon_damage <= 0 || radius <= 0 || distance >= radius) return 0;
    f32 factor = 1.0f - distance / radius;
    return std::max(1.0f, std::round(weapon_damage * factor));
}

f32 direct_hit_damage(f32 weapon_damage, f32 multiplier) {
    return std::round(weapon_damage * multiplier);
}

ExplosionOutcome resolve_explosion(const ExplosionRequest& request,
                                   map::Terrain* terrain,
                                   const std::vector<Tank*>& tanks) {
    ExplosionOutcome outcome;
    const auto& at = request.epicenter;

    if (terrain && request.radius > 0) {
        terrain->deform(at.x, at.y, request.radius, request.terrain_effect);
        outcome.terrain_deformed = true;
    }

    for (Tank* tank : tanks) {
        if (!tank || tank->destroyed()) continue;

        DamageEvent event;
        event.tank = tank;
        event.attacker = request.attacker;

        if (tank == request.direct_hit_tank) {
            event.damage = direct_hit_damage(request.damage,
                                             request.direct_hit_multiplier);
            event.was_direct_hit = true;
        } else {
            f32 dist = distance_to_rect(at.x, at.y, tank->bounds());
            event.damage = falloff_damage(request.damage, dist, request.radius);
        }

        if (event.damage <= 0) continue;

        event.actual_damage = tank->apply_damage(event.damage);
        spdlog::debug("Tank #{} took {} damage{} (health {})", tank->id(),
                      event.actual_damage,
                      event.was_direct_hit ? " [direct hit]" : "",
                      tank->health());
        outcome.damage.push_back(event);
    }

    return outcome;
}

} // namespace scorch::sim
