#include "sim/trajectory.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace scorch::sim {

const char* out_of_bounds_edge_name(OutOfBoundsEdge edge) {
    switch (edge) {
    case OutOfBoundsEdge::None: return "none";
    case OutOfBoundsEdge::Left: return "left";
    case OutOfBoundsEdge::Right: return "right";
    case OutOfBoundsEdge::Bottom: return "bottom";
    }
    return "unknown";
}

Vector2 launch_velocity(f32 angle_deg, f32 power, f32 max_velocity) {
    power = std::clamp(power, 0.0f, MAX_POWER);
    f32 speed = power / MAX_POWER * max_velocity;
    f32 radians = angle_deg * std::numbers::pi_v<f32> / 180.0f;
    // Screen Y is inverted, so "up" is negative vy
    return {std::cos(radians) * speed, -std::sin(radians) * speed};
}

IntegrationResult integrate(const KinematicState& state,
                            const PhysicsConfig& config) {
    IntegrationResult result;
    f32 prev_vy = state.vy;

    f32 vx = state.vx + config.wind_force;
    f32 vy = state.vy + config.gravity;

    if (config.max_speed > 0) {
        f32 speed = std::sqrt(vx * vx + vy * vy);
        if (speed > config.max_speed) {
            f32 scale = config.max_speed / speed;
            vx *= scale;
            vy *= scale;
        }
    }

    result.state.vx = vx;
    result.state.vy = vy;
    result.state.x = state.x + vx;
    result.state.y = state.y + vy;
    result.at_apex = prev_vy < 0 && vy >= 0;
    return result;
}

OutOfBoundsEdge out_of_bounds(f32 x, f32 y, f32 world_width, f32 world_height) {
    if (x < 0) return OutOfBoundsEdge::Left;
    if (x > world_width) return OutOfBoundsEdge::Right;
    if (y > world_height) return OutOfBoundsEdge::Bottom;
    return OutOfBoundsEdge::None;
}

} // namespace scorch::sim
