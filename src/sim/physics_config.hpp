#pragma once

#include "core/types.hpp"

#include <string_view>

namespace scorch::sim {

/// What happens when a projectile crosses a side wall or the ceiling.
enum class EdgeBehavior {
    None,   ///< Side walls: hard out-of-bounds. Ceiling: fly freely above it.
    Bounce,
    Wrap,
    Absorb,
};

const char* edge_behavior_name(EdgeBehavior behavior);

/// Parses "none" / "bounce" / "wrap" / "absorb" (case-insensitive).
bool parse_edge_behavior(std::string_view name, EdgeBehavior& out);

/// Everything the integrator and the boundary rules read.
/// Passed by value into each simulation so a shot preview and a live shot
/// never share mutable settings.
struct PhysicsConfig {
    f32 gravity = 0.2f;       ///< Downward acceleration, px/frame^2
    f32 wind_force = 0.0f;    ///< Horizontal acceleration, px/frame^2
    f32 max_velocity = 20.0f; ///< Launch speed at power 100, px/frame
    f32 max_speed = 0.0f;     ///< In-flight speed cap; 0 disables it
    f32 world_width = 1200.0f;
    f32 world_height = 800.0f;
    EdgeBehavior wall_behavior = EdgeBehavior::None;
    EdgeBehavior ceiling_behavior = EdgeBehavior::None;
};

} // namespace scorch::sim
