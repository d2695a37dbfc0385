#include "lua/config_loader.hpp"
#include "lua/blueprint_bindings.hpp"
#include "blueprints/weapon_catalog.hpp"
#include "sim/physics_config.hpp"

#include <string>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
}

namespace scorch::lua {

namespace {

/// LOG/WARN/SPEW/_ALERT: joins the arguments and logs them at the level
/// stored in the closure's upvalue.
int l_script_log(lua_State* L) {
    auto level = static_cast<spdlog::level::level_enum>(
        static_cast<int>(lua_tonumber(L, lua_upvalueindex(1))));
    std::string message;
    int n = lua_gettop(L);
    for (int i = 1; i <= n; i++) {
        if (lua_isstring(L, i)) {
            message += lua_tostring(L, i);
        } else if (lua_isboolean(L, i)) {
            message += lua_toboolean(L, i) ? "true" : "false";
        } else {
            message += lua_typename(L, lua_type(L, i));
        }
    }
    spdlog::log(level, "[script] {}", message);
    return 0;
}

void register_script_log(LuaState& state, const char* name,
                         spdlog::level::level_enum level) {
    lua_State* L = state.raw();
    lua_pushstring(L, name);
    lua_pushnumber(L, static_cast<lua_Number>(level));
    lua_pushcclosure(L, l_script_log, 1);
    lua_settable(L, LUA_GLOBALSINDEX);
}

} // namespace

ConfigLoader::ConfigLoader(blueprints::WeaponCatalog& catalog,
                           sim::PhysicsConfig& physics)
    : catalog_(catalog), physics_(physics) {
    if (!state_.valid()) return;

    register_config_bindings(state_);
    register_script_log(state_, "LOG", spdlog::level::info);
    register_script_log(state_, "WARN", spdlog::level::warn);
    register_script_log(state_, "SPEW", spdlog::level::debug);
    register_script_log(state_, "_ALERT", spdlog::level::err);
    state_.set_global_string("ScorchVersion", "0.1.0");
}

template <typename Run>
Result<LoadSummary> ConfigLoader::run(Run&& execute) {
    ConfigSession session;
    session.physics = physics_;

    state_.set_config_session(&session);
    Result<void> result = execute();
    state_.set_config_session(nullptr);

    if (!result) {
        return result.error();
    }

    LoadSummary summary;
    for (auto& def : session.weapons) {
        catalog_.add(std::move(def));
        summary.weapons_added++;
    }
    summary.weapons_skipped = session.skipped_weapons;
    if (session.physics_set) {
        physics_ = session.physics;
        summary.physics_changed = true;
    }
    return summary;
}

Result<LoadSummary> ConfigLoader::load_file(const fs::path& path) {
    spdlog::info("Loading config: {}", path.string());
    auto result = run([&] { return state_.do_file(path); });
    if (result) {
        const auto& s = result.value();
        spdlog::info("Config loaded: {} weapon(s), {} skipped, physics {}",
                     s.weapons_added, s.weapons_skipped,
                     s.physics_changed ? "updated" : "unchanged");
    }
    return result;
}

Result<LoadSummary> ConfigLoader::load_string(std::string_view code,
                                              const char* chunk_name) {
    return run([&] { return state_.do_string(code, chunk_name); });
}

} // namespace scorch::lua
