#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "lua/lua_state.hpp"

#include <string_view>

namespace scorch::blueprints {
class WeaponCatalog;
}

namespace scorch::sim {
struct PhysicsConfig;
}

namespace scorch::lua {

/// What a successful load changed.
struct LoadSummary {
    u32 weapons_added = 0;
    u32 weapons_skipped = 0;
    bool physics_changed = false;
};

/// Runs configuration scripts against a weapon catalog and a physics
/// config. A script is applied all-or-nothing: if it fails, neither target
/// is modified. Globals persist between loads on the same loader.
class ConfigLoader {
public:
    ConfigLoader(blueprints::WeaponCatalog& catalog,
                 sim::PhysicsConfig& physics);

    Result<LoadSummary> load_file(const fs::path& path);
    Result<LoadSummary> load_string(std::string_view code,
                                    const char* chunk_name = "=config");

    LuaState& state() { return state_; }

private:
    template <typename Run>
    Result<LoadSummary> run(Run&& execute);

    LuaState state_;
    blueprints::WeaponCatalog& catalog_;
    sim::PhysicsConfig& physics_;
};

} // namespace scorch::lua
