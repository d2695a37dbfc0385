#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace scorch::lua {

struct ConfigSession;

/// Registry key under which the active ConfigSession is stored.
constexpr const char* REG_CONFIG_SESSION = "scorch_config_session";

/// RAII wrapper around a Lua 5.0 state with the base, table, string and
/// math libraries open. Configuration scripts get no io/os access.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }
    bool valid() const { return L_ != nullptr; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    void set_global_string(const char* name, const char* value);
    void set_global_number(const char* name, f64 value);

    /// Read a numeric global; nullopt if unset or not a number.
    std::optional<f64> get_global_number(const char* name) const;

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code,
                           const char* chunk_name = "=string");

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

    /// Point the C bindings at a session (null detaches it).
    void set_config_session(ConfigSession* session);

    /// Session attached to the given state, for use in C bindings.
    static ConfigSession* get_config_session(lua_State* L);

private:
    Result<void> run_loaded_chunk(int load_status, const char* name);

    lua_State* L_ = nullptr;
};

} // namespace scorch::lua
