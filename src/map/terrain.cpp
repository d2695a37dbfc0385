#include "map/terrain.hpp"

#include <algorithm>
#include <cmath>

namespace scorch::map {

namespace {
// Burn marks sink the surface by at most this fraction of the radius
constexpr f32 BURN_DEPTH_FACTOR = 0.25f;
} // namespace

const char* deform_kind_name(DeformKind kind) {
    switch (kind) {
    case DeformKind::Explosion: return "explosion";
    case DeformKind::Dirt: return "dirt";
    case DeformKind::Tunnel: return "tunnel";
    case DeformKind::Burn: return "burn";
    }
    return "unknown";
}

HeightmapTerrain::HeightmapTerrain(Heightmap heightmap, f32 world_height)
    : heightmap_(std::move(heightmap)), world_height_(world_height) {}

f32 HeightmapTerrain::get_height(f32 x) const {
    return heightmap_.get_height(x);
}

f32 HeightmapTerrain::get_width() const {
    return static_cast<f32>(heightmap_.width());
}

bool HeightmapTerrain::check_collision(f32 x, f32 y) const {
    if (x < 0 || x >= get_width() || y < 0 || y >= world_height_) {
        return false;
    }
    if (y < heightmap_.get_height(x)) return false;
    return !inside_cavity(x, y);
}

bool HeightmapTerrain::inside_cavity(f32 x, f32 y) const {
    for (const auto& c : cavities_) {
        f32 dx = x - c.x;
        f32 dy = y - c.y;
        if (dx * dx + dy * dy <= c.radius * c.radius) return true;
    }
    return false;
}

void HeightmapTerrain::deform(f32 x, f32 y, f32 radius, DeformKind kind) {
    if (radius <= 0) return;

    if (kind == DeformKind::Tunnel) {
        // Cavities never move the surface; they only hollow out the ground
        add_cavity({x, y, radius});
        return;
    }

    f32 max_x = get_width();
    u32 first = static_cast<u32>(std::clamp(std::floor(x - radius), 0.0f, max_x));
    u32 last = static_cast<u32>(std::clamp(std::ceil(x + radius), 0.0f, max_x));
    bool changed = false;

    for (u32 col = first; col <= last; col++) {
        f32 dx = static_cast<f32>(col) - x;
        if (std::abs(dx) > radius) continue;
        f32 half_chord = std::sqrt(radius * radius - dx * dx);
        f32 surface = heightmap_.get_height_at_column(col);
        f32 updated = surface;

        switch (kind) {
        case DeformKind::Explosion:
            // Only columns where the disc reaches the ground lose material
            if (y + half_chord > surface) {
                updated = std::min(world_height_, y + half_chord);
            }
            break;
        case DeformKind::Dirt:
            updated = std::min(surface, std::max(0.0f, y - half_chord));
            break;
        case DeformKind::Burn:
            if (std::abs(surface - y) <= radius) {
                f32 depth = radius * BURN_DEPTH_FACTOR *
                            (1.0f - std::abs(dx) / radius);
                updated = std::min(world_height_, surface + depth);
            }
            break;
        case DeformKind::Tunnel:
            break;
        }

        if (updated != surface) {
            heightmap_.set_height_at_column(col, updated);
            changed = true;
        }
    }

    if (changed && kind != DeformKind::Burn) {
        heightmap_.smooth(first, last);
    }
    if (changed) drop_exposed_cavities();
}

void HeightmapTerrain::add_cavity(const Cavity& cavity) {
    auto contains = [](const Cavity& outer, const Cavity& inner) {
        f32 d = std::hypot(inner.x - outer.x, inner.y - outer.y);
        return d + inner.radius <= outer.radius;
    };
    for (const auto& c : cavities_) {
        if (contains(c, cavity)) return;
    }
    std::erase_if(cavities_,
                  [&](const Cavity& c) { return contains(cavity, c); });
    cavities_.push_back(cavity);
}

void HeightmapTerrain::drop_exposed_cavities() {
    f32 max_x = get_width();
    std::erase_if(cavities_, [&](const Cavity& c) {
        u32 first = static_cast<u32>(std::clamp(std::floor(c.x - c.radius), 0.0f, max_x));
        u32 last = static_cast<u32>(std::clamp(std::ceil(c.x + c.radius), 0.0f, max_x));
        f32 highest_ground = world_height_;
        for (u32 col = first; col <= last; col++) {
            highest_ground = std::min(highest_ground, heightmap_.get_height_at_column(col));
        }
        // Entirely open air now
        return c.y + c.radius < highest_ground;
    });
}

} // namespace scorch::map
