#pragma once

#include "map/heightmap.hpp"

#include <vector>

namespace scorch::map {

/// Terrain-side effect requested by an explosion or a tunnelling warhead.
enum class DeformKind {
    Explosion, ///< Remove a disc of ground (crater)
    Dirt,      ///< Deposit a disc of ground
    Tunnel,    ///< Hollow out a cavity below the surface
    Burn,      ///< Shallow scorch, a fraction of the radius deep
};

const char* deform_kind_name(DeformKind kind);

/// Destructible terrain as seen by the projectile simulation.
/// All coordinates are world pixels with Y growing downward.
class Terrain {
public:
    virtual ~Terrain() = default;

    /// Y of the ground surface at column x.
    virtual f32 get_height(f32 x) const = 0;

    virtual f32 get_width() const = 0;

    /// True if (x, y) is inside solid ground.
    virtual bool check_collision(f32 x, f32 y) const = 0;

    virtual void deform(f32 x, f32 y, f32 radius, DeformKind kind) = 0;
};

/// Column height-field terrain with tunnel cavities.
class HeightmapTerrain : public Terrain {
public:
    /// world_height is the floor: the surface never sinks below it.
    HeightmapTerrain(Heightmap heightmap, f32 world_height);

    f32 get_height(f32 x) const override;
    f32 get_width() const override;
    bool check_collision(f32 x, f32 y) const override;
    void deform(f32 x, f32 y, f32 radius, DeformKind kind) override;

    const Heightmap& heightmap() const { return heightmap_; }
    f32 world_height() const { return world_height_; }
    size_t cavity_count() const { return cavities_.size(); }

private:
    struct Cavity {
        f32 x, y, radius;
    };

    bool inside_cavity(f32 x, f32 y) const;
    /// Skips cavities already covered by an existing one and absorbs the
    /// ones the new cavity covers.
    void add_cavity(const Cavity& cavity);
    /// Forget cavities a crater has left wholly above the surface.
    void drop_exposed_cavities();

    Heightmap heightmap_;
    f32 world_height_;
    std::vector<Cavity> cavities_;
};

} // namespace scorch::map
