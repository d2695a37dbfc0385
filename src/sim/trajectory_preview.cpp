#include "sim/trajectory_preview.hpp"

#include "sim/boundary.hpp"
#include "sim/collision.hpp"
#include "sim/trajectory.hpp"

namespace scorch::sim {

const char* preview_outcome_name(PreviewOutcome outcome) {
    switch (outcome) {
    case PreviewOutcome::TerrainHit: return "terrain_hit";
    case PreviewOutcome::TankHit: return "tank_hit";
    case PreviewOutcome::OutOfBounds: return "out_of_bounds";
    case PreviewOutcome::Absorbed: return "absorbed";
    case PreviewOutcome::StepLimit: return "step_limit";
    }
    return "unknown";
}

TrajectoryPreview preview_trajectory(const PhysicsConfig& config,
                                     const map::Terrain* terrain,
                                     const std::vector<Tank*>& tanks,
                                     Vector2 start, f32 angle, f32 power,
                                     u32 max_steps) {
    TrajectoryPreview preview;
    preview.points.push_back(start);
    preview.landing = start;

    Vector2 v = launch_velocity(angle, power, config.max_velocity);
    KinematicState state{start.x, start.y, v.x, v.y};
    bool edges = config.wall_behavior != EdgeBehavior::None ||
                 config.ceiling_behavior != EdgeBehavior::None;

    while (preview.steps < max_steps) {
        f32 prev_vy = state.vy;
        state = integrate(state, config).state;
        preview.steps++;

        if (edges) {
            auto edge = resolve_boundary(state.x, state.y, state.vx, state.vy,
                                         config.world_width, config.world_height,
                                         config.wall_behavior,
                                         config.ceiling_behavior);
            if (edge.absorbed) {
                preview.points.push_back({state.x, state.y});
                preview.landing = {state.x, state.y};
                preview.outcome = PreviewOutcome::Absorbed;
                return preview;
            }
            if (edge.hit) state = {edge.x, edge.y, edge.vx, edge.vy};
        }

        Vector2 point{state.x, state.y};
        preview.points.push_back(point);
        preview.landing = point;

        if (prev_vy < 0 && state.vy >= 0 && !preview.apex) preview.apex = point;

        if (out_of_bounds(state.x, state.y, config.world_width,
                          config.world_height) != OutOfBoundsEdge::None) {
            preview.outcome = PreviewOutcome::OutOfBounds;
            return preview;
        }
        if (auto hit = tank_hit(state.x, state.y, tanks)) {
            preview.outcome = PreviewOutcome::TankHit;
            preview.hit_tank = hit->tank;
            return preview;
        }
        if (terrain_hit(terrain, state.x, state.y)) {
            preview.outcome = PreviewOutcome::TerrainHit;
            return preview;
        }
    }
    preview.outcome = PreviewOutcome::StepLimit;
    return preview;
}

} // namespace scorch::sim
