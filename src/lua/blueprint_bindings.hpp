#pragma once

#include "blueprints/weapon_def.hpp"
#include "sim/physics_config.hpp"

#include <vector>

struct lua_State;

namespace scorch::lua {

class LuaState;

/// Staging area the script bindings write into. Nothing reaches the live
/// catalog or physics settings until the whole script has run.
struct ConfigSession {
    sim::PhysicsConfig physics;
    bool physics_set = false;
    std::vector<blueprints::WeaponDef> weapons;
    u32 skipped_weapons = 0;
};

/// Register the WeaponBlueprint and Physics C functions into Lua.
void register_config_bindings(LuaState& state);

/// Parses "explosion"/"crater", "dirt", "burn" and "tunnel"
/// (case-insensitive). Returns false on unknown names.
bool parse_terrain_effect(std::string_view name, map::DeformKind& out);

} // namespace scorch::lua
