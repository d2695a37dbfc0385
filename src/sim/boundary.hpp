#pragma once

#include "sim/physics_config.hpp"

namespace scorch::sim {

/// Velocity kept after a wall or ceiling bounce.
constexpr f32 BOUNCE_RESTITUTION = 0.8f;

struct BoundaryResult {
    f32 x = 0, y = 0;
    f32 vx = 0, vy = 0;
    bool hit = false;      ///< A side wall or the ceiling was crossed
    bool bounced = false;  ///< At least one crossing was resolved by bouncing
    bool absorbed = false; ///< The projectile must be removed, no explosion
};

/// Apply the configured wall/ceiling behaviour to a position that may have
/// left the world through a side (x < 0 or x > width) or the top (y < 0).
/// The floor is never handled here. With EdgeBehavior::None the input is
/// returned unchanged.
BoundaryResult resolve_boundary(f32 x, f32 y, f32 vx, f32 vy,
                                f32 world_width, f32 world_height,
                                EdgeBehavior wall, EdgeBehavior ceiling);

} // namespace scorch::sim
