#pragma once

#include "sim/geometry.hpp"

#include <optional>
#include <vector>

namespace scorch::map {
class Terrain;
}

namespace scorch::sim {

class Tank;

/// A point within this distance of a tank's center counts as a direct hit.
constexpr f32 DIRECT_HIT_RADIUS = 5.0f;

struct TankHit {
    Tank* tank = nullptr;
    bool direct_hit = false;
};

/// Terrain test at the integer column of x. A null terrain never collides.
bool terrain_hit(const map::Terrain* terrain, f32 x, f32 y);

/// First live tank (in the given order) whose box contains the point.
/// Null entries and destroyed tanks are skipped. nullopt when nothing is hit.
std::optional<TankHit> tank_hit(f32 x, f32 y, const std::vector<Tank*>& tanks);

/// Distance from a point to the nearest edge of a rectangle; 0 inside it.
f32 distance_to_rect(f32 px, f32 py, const Rect& rect);

} // namespace scorch::sim
