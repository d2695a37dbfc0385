#pragma once

#include "sim/geometry.hpp"

#include <algorithm>
#include <string>

namespace scorch::sim {

/// A tank as seen by the projectile simulation. The game owns tanks; the
/// simulation only reads their boxes and calls apply_damage().
class Tank {
public:
    static constexpr f32 WIDTH = 64.0f;
    static constexpr f32 HEIGHT = 32.0f;
    static constexpr f32 DEFAULT_HEALTH = 100.0f;

    Tank() = default;
    Tank(u32 id, i32 owner, f32 x, f32 y) : id_(id), owner_(owner), position_{x, y} {}

    u32 id() const { return id_; }
    void set_id(u32 id) { id_ = id; }

    /// Side index; projectiles carry the same value as their owner.
    i32 owner() const { return owner_; }
    void set_owner(i32 owner) { owner_ = owner; }

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }

    /// Bottom-center of the hull, resting on the ground.
    const Vector2& position() const { return position_; }
    void set_position(const Vector2& p) { position_ = p; }

    Rect bounds() const {
        return {position_.x - WIDTH / 2, position_.y - HEIGHT, WIDTH, HEIGHT};
    }

    Vector2 center() const { return {position_.x, position_.y - HEIGHT / 2}; }

    f32 health() const { return health_; }
    void set_health(f32 h) { health_ = std::max(0.0f, h); }

    f32 max_health() const { return max_health_; }
    void set_max_health(f32 h) { max_health_ = h; }

    bool destroyed() const { return health_ <= 0; }

    /// Subtract damage, clamped at zero health. Returns the damage actually
    /// dealt (never more than the remaining health).
    f32 apply_damage(f32 amount) {
        f32 damage = std::max(0.0f, amount);
        f32 actual = std::min(damage, health_);
        health_ -= actual;
        return actual;
    }

    // Reward bookkeeping, updated by the game from damage events
    i32 money() const { return money_; }
    void add_money(i32 amount) { money_ += amount; }

    i32 score() const { return score_; }
    void add_score(i32 points) { score_ += points; }

private:
    u32 id_ = 0;
    i32 owner_ = -1;
    std::string name_;
    Vector2 position_;
    f32 health_ = DEFAULT_HEALTH;
    f32 max_health_ = DEFAULT_HEALTH;
    i32 money_ = 0;
    i32 score_ = 0;
};

} // namespace scorch::sim
