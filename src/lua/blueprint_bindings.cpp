#include "lua/blueprint_bindings.hpp"
#include "lua/lua_state.hpp"
#include "sim/wind.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace scorch::lua {

namespace {

// Field readers for the table at stack index 1. A present field of the
// wrong type is reported as missing.

std::optional<f64> field_number(lua_State* L, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, 1);
    std::optional<f64> result;
    if (lua_type(L, -1) == LUA_TNUMBER) result = lua_tonumber(L, -1);
    lua_pop(L, 1);
    return result;
}

std::optional<std::string> field_string(lua_State* L, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, 1);
    std::optional<std::string> result;
    if (lua_type(L, -1) == LUA_TSTRING) result = lua_tostring(L, -1);
    lua_pop(L, 1);
    return result;
}

std::optional<bool> field_bool(lua_State* L, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, 1);
    std::optional<bool> result;
    if (lua_isboolean(L, -1)) result = lua_toboolean(L, -1) != 0;
    lua_pop(L, 1);
    return result;
}

/// Reads a numeric field into `out`. Values that are not finite or do not
/// fit T are reported and leave `out` at its default.
template <typename T>
void read_number(lua_State* L, const char* key, T& out) {
    auto v = field_number(L, key);
    if (!v) return;
    f64 lo = static_cast<f64>(std::numeric_limits<T>::lowest());
    f64 hi = static_cast<f64>(std::numeric_limits<T>::max());
    if (!std::isfinite(*v) || *v < lo || *v > hi) {
        spdlog::warn("{} = {} is out of range, keeping {}", key, *v, out);
        return;
    }
    out = static_cast<T>(*v);
}

std::string to_lower(std::string_view s) {
    std::string key(s);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return key;
}

blueprints::WeaponBehavior read_behavior(lua_State* L,
                                         blueprints::WeaponKind kind) {
    using namespace blueprints;
    switch (kind) {
    case WeaponKind::Splitting: {
        SplittingBehavior split;
        read_number(L, "SplitCount", split.split_count);
        read_number(L, "SplitAngle", split.split_angle);
        if (split.split_count > MAX_SPLIT_COUNT) {
            spdlog::warn("SplitCount {} capped at {}", split.split_count,
                         MAX_SPLIT_COUNT);
            split.split_count = MAX_SPLIT_COUNT;
        }
        return split;
    }
    case WeaponKind::Rolling: {
        RollingBehavior roll;
        read_number(L, "RollTimeout", roll.roll_timeout_ms);
        return roll;
    }
    case WeaponKind::Digging: {
        DiggingBehavior dig;
        read_number(L, "TunnelDistance", dig.tunnel_distance);
        read_number(L, "TunnelRadius", dig.tunnel_radius);
        return dig;
    }
    case WeaponKind::Nuclear: return NuclearBehavior{};
    case WeaponKind::Special: return SpecialBehavior{};
    case WeaponKind::Standard: break;
    }
    return StandardBehavior{};
}

int l_WeaponBlueprint(lua_State* L) {
    luaL_checktype(L, 1, LUA_TTABLE);
    auto* session = LuaState::get_config_session(L);
    if (!session) {
        return luaL_error(L, "WeaponBlueprint: no configuration session");
    }

    blueprints::WeaponDef def;
    def.id = field_string(L, "Id").value_or("");
    if (def.id.empty()) {
        spdlog::warn("WeaponBlueprint without Id, skipping");
        session->skipped_weapons++;
        return 0;
    }
    def.name = field_string(L, "Name").value_or(def.id);
    def.description = field_string(L, "Description").value_or("");

    read_number(L, "Cost", def.cost);
    read_number(L, "Ammo", def.ammo);
    read_number(L, "Damage", def.damage);
    read_number(L, "BlastRadius", def.blast_radius);
    read_number(L, "DirectHitMultiplier", def.direct_hit_multiplier);
    read_number(L, "BounceCount", def.bounce_count);

    if (auto effect = field_string(L, "TerrainEffect")) {
        if (!parse_terrain_effect(*effect, def.terrain_effect)) {
            spdlog::warn("Weapon '{}': unknown TerrainEffect '{}', using crater",
                         def.id, *effect);
        }
    }

    auto kind = blueprints::WeaponKind::Standard;
    if (auto type = field_string(L, "Type")) {
        if (!blueprints::parse_weapon_kind(*type, kind)) {
            spdlog::warn("Weapon '{}': unknown Type '{}', treating as standard",
                         def.id, *type);
        }
    }
    def.behavior = read_behavior(L, kind);

    def.visuals.screen_shake = field_bool(L, "ScreenShake").value_or(false);
    def.visuals.screen_flash = field_bool(L, "ScreenFlash").value_or(false);
    def.visuals.mushroom_cloud = field_bool(L, "MushroomCloud").value_or(false);
    read_number(L, "ProjectileColor", def.visuals.projectile_color);
    def.visuals.trail_color = def.visuals.projectile_color;
    read_number(L, "TrailColor", def.visuals.trail_color);

    spdlog::debug("WeaponBlueprint '{}' ({})", def.id,
                  blueprints::weapon_kind_name(def.kind()));
    session->weapons.push_back(std::move(def));
    return 0;
}

/// Reads the Physics{} table over `config`. Returns an error message for
/// values the simulation cannot run with.
std::optional<std::string> read_physics(lua_State* L, sim::PhysicsConfig& config) {
    for (const char* key : {"Gravity", "Wind", "WindForce", "MaxVelocity",
                            "MaxSpeed", "WorldWidth", "WorldHeight"}) {
        auto v = field_number(L, key);
        if (v && !std::isfinite(*v)) {
            return std::string("Physics: ") + key + " must be a finite number";
        }
    }
    read_number(L, "Gravity", config.gravity);
    if (auto wind = field_number(L, "Wind")) {
        config.wind_force = sim::wind_force(static_cast<f32>(*wind));
    }
    read_number(L, "WindForce", config.wind_force);
    read_number(L, "MaxVelocity", config.max_velocity);
    read_number(L, "MaxSpeed", config.max_speed);
    read_number(L, "WorldWidth", config.world_width);
    read_number(L, "WorldHeight", config.world_height);

    if (config.world_width <= 0 || config.world_height <= 0) {
        return "Physics: world size must be positive";
    }
    if (config.max_velocity <= 0) {
        return "Physics: MaxVelocity must be positive";
    }
    if (auto wall = field_string(L, "WallBehavior")) {
        if (!sim::parse_edge_behavior(*wall, config.wall_behavior)) {
            return "Physics: unknown WallBehavior '" + *wall + "'";
        }
    }
    if (auto ceiling = field_string(L, "CeilingBehavior")) {
        if (!sim::parse_edge_behavior(*ceiling, config.ceiling_behavior)) {
            return "Physics: unknown CeilingBehavior '" + *ceiling + "'";
        }
    }
    return std::nullopt;
}

int l_Physics(lua_State* L) {
    luaL_checktype(L, 1, LUA_TTABLE);
    auto* session = LuaState::get_config_session(L);
    if (!session) {
        return luaL_error(L, "Physics: no configuration session");
    }

    bool failed = false;
    {
        sim::PhysicsConfig config = session->physics;
        if (auto err = read_physics(L, config)) {
            lua_pushstring(L, err->c_str());
            failed = true;
        } else {
            session->physics = config;
            session->physics_set = true;
        }
    }
    // lua_error longjmps, so raise it only once the C++ locals are gone
    if (failed) return lua_error(L);
    return 0;
}

} // namespace

bool parse_terrain_effect(std::string_view name, map::DeformKind& out) {
    auto key = to_lower(name);
    if (key == "explosion" || key == "crater") {
        out = map::DeformKind::Explosion;
    } else if (key == "dirt") {
        out = map::DeformKind::Dirt;
    } else if (key == "burn") {
        out = map::DeformKind::Burn;
    } else if (key == "tunnel") {
        out = map::DeformKind::Tunnel;
    } else {
        return false;
    }
    return true;
}

void register_config_bindings(LuaState& state) {
    state.register_function("WeaponBlueprint", l_WeaponBlueprint);
    state.register_function("Physics", l_Physics);
}

} // namespace scorch::lua
