#pragma once

#include "blueprints/weapon_def.hpp"
#include "sim/geometry.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <variant>

namespace scorch::sim {

/// Why a projectile stopped. None of these are errors.
enum class TerminationReason {
    TerrainHit,
    TankHit,
    OutOfBounds,
    Absorbed,        ///< Wall/ceiling absorb mode, no explosion
    Split,           ///< Parent replaced by its children, no explosion
    Timeout,         ///< Roller ran out of time
    Wall,            ///< Roller would leave the world
    Valley,          ///< Roller stalled facing uphill
    TunnelExit,      ///< Digger broke out of the ground
    TunnelExhausted, ///< Digger used its whole tunnel distance
    Cancelled,       ///< Turn reset while in flight
};

const char* termination_reason_name(TerminationReason reason);

/// True for reasons that end with an explosion.
bool termination_explodes(TerminationReason reason);

// Motion states. A projectile is in exactly one of these at a time.
struct Flying {
    f32 vx = 0, vy = 0;
    f32 prev_vy = 0; ///< vy before the last integration step
};

struct Rolling {
    f64 start_time_ms = 0;
    f32 velocity = 0;   ///< Signed, px/frame along x
    i32 direction = 1;  ///< +1 right, -1 left
    f32 rotation = 0;   ///< Cosmetic spin, radians
};

struct Tunneling {
    f32 dir_x = 0, dir_y = 0; ///< Unit vector
    f32 speed = 0;            ///< px/frame
    f32 travelled = 0;
};

struct Inactive {
    TerminationReason reason = TerminationReason::Cancelled;
};

using MotionState = std::variant<Flying, Rolling, Tunneling, Inactive>;

class Projectile {
public:
    static constexpr size_t TRAIL_LENGTH = 20;

    Projectile(u32 id, i32 owner,
               std::shared_ptr<const blueprints::WeaponDef> weapon,
               Vector2 position, Vector2 velocity, bool is_child = false);

    u32 id() const { return id_; }
    i32 owner() const { return owner_; }

    const blueprints::WeaponDef& weapon() const { return *weapon_; }
    const std::shared_ptr<const blueprints::WeaponDef>& weapon_ptr() const {
        return weapon_;
    }

    bool is_child() const { return is_child_; }
    bool has_split() const { return has_split_; }
    void mark_split() { has_split_ = true; }

    const Vector2& position() const { return position_; }
    void set_position(f32 x, f32 y) { position_ = {x, y}; }

    /// Current velocity; rolling reports (velocity, 0), inactive (0, 0).
    Vector2 velocity() const;

    const MotionState& state() const { return state_; }
    bool active() const { return !std::holds_alternative<Inactive>(state_); }
    bool is_flying() const { return std::holds_alternative<Flying>(state_); }
    bool is_rolling() const { return std::holds_alternative<Rolling>(state_); }
    bool is_tunneling() const { return std::holds_alternative<Tunneling>(state_); }

    Flying* flying() { return std::get_if<Flying>(&state_); }
    Rolling* rolling() { return std::get_if<Rolling>(&state_); }
    Tunneling* tunneling() { return std::get_if<Tunneling>(&state_); }
    const Rolling* rolling() const { return std::get_if<Rolling>(&state_); }
    const Tunneling* tunneling() const { return std::get_if<Tunneling>(&state_); }

    /// Reason the projectile stopped, if it has.
    std::optional<TerminationReason> termination() const;

    /// Flying -> Rolling / Tunneling. Refused (returns false) from any other
    /// state, so each transition can happen at most once.
    bool start_rolling(const Rolling& roll);
    bool start_tunneling(const Tunneling& tunnel);

    /// Terminal. A second call keeps the first reason.
    void deactivate(TerminationReason reason);

    u32 bounces() const { return bounces_; }
    void add_bounce() { bounces_++; }

    /// Recent positions, oldest first, at most TRAIL_LENGTH entries.
    const std::deque<Vector2>& trail() const { return trail_; }
    void record_trail();

private:
    u32 id_;
    i32 owner_;
    std::shared_ptr<const blueprints::WeaponDef> weapon_;
    bool is_child_;
    bool has_split_ = false;
    Vector2 position_;
    MotionState state_;
    u32 bounces_ = 0;
    std::deque<Vector2> trail_;
};

} // namespace scorch::sim
