#pragma once

#include "core/types.hpp"
#include "map/terrain.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace scorch::blueprints {

enum class WeaponKind {
    Standard,
    Splitting,
    Rolling,
    Digging,
    Nuclear,
    Special,
};

const char* weapon_kind_name(WeaponKind kind);

/// Parses "standard", "splitting", ... (case-insensitive).
/// Returns false and leaves `out` untouched on unknown names.
bool parse_weapon_kind(std::string_view name, WeaponKind& out);

/// Fallbacks used when a weapon record leaves a behaviour field out.
constexpr f32 DEFAULT_SPLIT_ANGLE = 30.0f;
constexpr f64 DEFAULT_ROLL_TIMEOUT_MS = 3000.0;
constexpr f32 DEFAULT_TUNNEL_DISTANCE = 100.0f;
constexpr f32 DEFAULT_TUNNEL_RADIUS = 10.0f;
constexpr f32 DEFAULT_DIRECT_HIT_MULTIPLIER = 1.5f;
/// Most warheads a splitting weapon may release.
constexpr u32 MAX_SPLIT_COUNT = 32;

// Per-kind behaviour payloads. Each carries only what its motion mode reads.
struct StandardBehavior {};

struct SplittingBehavior {
    u32 split_count = 0;
    f32 split_angle = DEFAULT_SPLIT_ANGLE; ///< Total spread in degrees
};

struct RollingBehavior {
    f64 roll_timeout_ms = DEFAULT_ROLL_TIMEOUT_MS;
};

struct DiggingBehavior {
    f32 tunnel_distance = DEFAULT_TUNNEL_DISTANCE;
    f32 tunnel_radius = DEFAULT_TUNNEL_RADIUS;
};

struct NuclearBehavior {};

/// Flies like a standard shell; the terrain effect carries the difference.
struct SpecialBehavior {};

using WeaponBehavior =
    std::variant<StandardBehavior, SplittingBehavior, RollingBehavior,
                 DiggingBehavior, NuclearBehavior, SpecialBehavior>;

/// Presentation hints passed through to explosion events untouched.
struct VisualFlags {
    bool screen_shake = false;
    bool screen_flash = false;
    bool mushroom_cloud = false;
    u32 projectile_color = 0xf9f002;
    u32 trail_color = 0xf9f002;
};

/// Immutable weapon record. Once registered in a WeaponCatalog it is only
/// handed out as const.
struct WeaponDef {
    std::string id;          ///< Lowercase kebab-case id (e.g., "mirv")
    std::string name;
    std::string description;
    i32 cost = 0;
    i32 ammo = -1;           ///< Rounds per purchase; -1 = unlimited
    f32 damage = 0;          ///< Damage at the epicenter
    f32 blast_radius = 0;
    f32 direct_hit_multiplier = 0; ///< <= 0 means "use the default 1.5x"
    u32 bounce_count = 0;    ///< Wall/ceiling bounces allowed; 0 = no limit
    map::DeformKind terrain_effect = map::DeformKind::Explosion;
    VisualFlags visuals;
    WeaponBehavior behavior;

    WeaponKind kind() const;

    f32 effective_direct_hit_multiplier() const {
        return direct_hit_multiplier > 0 ? direct_hit_multiplier
                                         : DEFAULT_DIRECT_HIT_MULTIPLIER;
    }
};

} // namespace scorch::blueprints
