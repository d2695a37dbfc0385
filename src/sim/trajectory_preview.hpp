#pragma once

#include "sim/physics_config.hpp"
#include "sim/geometry.hpp"

#include <optional>
#include <vector>

namespace scorch::map {
class Terrain;
}

namespace scorch::sim {

class Tank;

enum class PreviewOutcome {
    TerrainHit,
    TankHit,
    OutOfBounds,
    Absorbed,
    StepLimit,
};

const char* preview_outcome_name(PreviewOutcome outcome);

struct TrajectoryPreview {
    std::vector<Vector2> points; ///< Launch point first, one entry per step
    std::optional<Vector2> apex;
    u32 steps = 0;
    Vector2 landing;             ///< Last sampled point
    PreviewOutcome outcome = PreviewOutcome::StepLimit;
    Tank* hit_tank = nullptr;    ///< Set for PreviewOutcome::TankHit
};

/// Dry run of a ballistic shot with the live integrator, boundary and
/// collision rules. Terrain and tanks are only read. Special weapon modes
/// (split, roll, dig) are not followed: the preview stops at first contact.
TrajectoryPreview preview_trajectory(const PhysicsConfig& config,
                                     const map::Terrain* terrain,
                                     const std::vector<Tank*>& tanks,
                                     Vector2 start, f32 angle, f32 power,
                                     u32 max_steps = 500);

} // namespace scorch::sim
