#include "lua/lua_state.hpp"

#include <fstream>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace scorch::lua {

LuaState::LuaState() {
    L_ = lua_open();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    luaopen_base(L_);
    luaopen_table(L_);
    luaopen_string(L_);
    luaopen_math(L_);
    // The luaopen_* calls leave their library tables on the stack in 5.0
    lua_settop(L_, 0);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

std::optional<f64> LuaState::get_global_number(const char* name) const {
    lua_getglobal(L_, name);
    std::optional<f64> result;
    if (lua_type(L_, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L_, -1);
    }
    lua_pop(L_, 1);
    return result;
}

Result<void> LuaState::do_string(std::string_view code,
                                 const char* chunk_name) {
    return do_buffer(code.data(), code.size(), chunk_name);
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error("Failed to open file", path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(buffer.data(), size)) {
        return Error("Failed to read file", path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    if (!L_) return Error("Lua state not initialized", name);

    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    return run_loaded_chunk(luaL_loadbuffer(L_, buf, len, name), name);
}

Result<void> LuaState::run_loaded_chunk(int load_status, const char* name) {
    std::string source = name;
    if (!source.empty() && (source[0] == '@' || source[0] == '=')) {
        source.erase(0, 1);
    }

    if (load_status != 0) {
        std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        return Error(std::move(err), std::move(source));
    }

    if (lua_pcall(L_, 0, 0, 0) != 0) {
        std::string err = lua_isstring(L_, -1) ? lua_tostring(L_, -1)
                                               : "error object is not a string";
        lua_pop(L_, 1);
        return Error(std::move(err), std::move(source));
    }
    return {};
}

void LuaState::set_config_session(ConfigSession* session) {
    lua_pushstring(L_, REG_CONFIG_SESSION);
    lua_pushlightuserdata(L_, session);
    lua_settable(L_, LUA_REGISTRYINDEX);
}

ConfigSession* LuaState::get_config_session(lua_State* L) {
    lua_pushstring(L, REG_CONFIG_SESSION);
    lua_gettable(L, LUA_REGISTRYINDEX);
    auto* session = static_cast<ConfigSession*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    return session;
}

} // namespace scorch::lua
