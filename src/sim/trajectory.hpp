#pragma once

#include "sim/geometry.hpp"
#include "sim/physics_config.hpp"

namespace scorch::sim {

/// Position and velocity of a ballistic projectile, in px and px/frame.
struct KinematicState {
    f32 x = 0, y = 0;
    f32 vx = 0, vy = 0;
};

struct IntegrationResult {
    KinematicState state;
    bool at_apex = false; ///< Vertical velocity flipped from up to down this step
};

enum class OutOfBoundsEdge {
    None,
    Left,
    Right,
    Bottom,
};

const char* out_of_bounds_edge_name(OutOfBoundsEdge edge);

constexpr f32 MAX_POWER = 100.0f;

/// Initial velocity for a shot. Angle is in degrees counter-clockwise from
/// +X (90 = straight up); power is clamped to [0, 100].
Vector2 launch_velocity(f32 angle_deg, f32 power, f32 max_velocity);

/// One semi-implicit Euler step: wind and gravity update the velocity, the
/// optional speed cap rescales it, then the position moves by the new
/// velocity. Apex is reported when vy goes from negative to >= 0.
IntegrationResult integrate(const KinematicState& state,
                            const PhysicsConfig& config);

/// x < 0, x > width or y > height. Flying above the top edge is allowed.
OutOfBoundsEdge out_of_bounds(f32 x, f32 y, f32 world_width, f32 world_height);

} // namespace scorch::sim
