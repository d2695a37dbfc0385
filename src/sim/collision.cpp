#include "sim/collision.hpp"
#include "map/terrain.hpp"
#include "sim/tank.hpp"

#include <algorithm>
#include <cmath>

namespace scorch::sim {

bool terrain_hit(const map::Terrain* terrain, f32 x, f32 y) {
    if (!terrain) return false;
    return terrain->check_collision(std::floor(x), y);
}

std::optional<TankHit> tank_hit(f32 x, f32 y, const std::vector<Tank*>& tanks) {
    for (Tank* tank : tanks) {
        if (!tank || tank->destroyed()) continue;
        if (!tank->bounds().contains(x, y)) continue;

        auto c = tank->center();
        f32 dx = x - c.x;
        f32 dy = y - c.y;
        bool direct = dx * dx + dy * dy <= DIRECT_HIT_RADIUS * DIRECT_HIT_RADIUS;
        return TankHit{tank, direct};
    }
    return std::nullopt;
}

f32 distance_to_rect(f32 px, f32 py, const Rect& rect) {
    f32 closest_x = std::clamp(px, rect.x, rect.x + rect.width);
    f32 closest_y = std::clamp(py, rect.y, rect.y + rect.height);
    f32 dx = px - closest_x;
    f32 dy = py - closest_y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace scorch::sim
