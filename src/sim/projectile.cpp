#include "sim/projectile.hpp"

namespace scorch::sim {

const char* termination_reason_name(TerminationReason reason) {
    switch (reason) {
    case TerminationReason::TerrainHit: return "terrain_hit";
    case TerminationReason::TankHit: return "tank_hit";
    case TerminationReason::OutOfBounds: return "out_of_bounds";
    case TerminationReason::Absorbed: return "absorbed";
    case TerminationReason::Split: return "split";
    case TerminationReason::Timeout: return "timeout";
    case TerminationReason::Wall: return "wall";
    case TerminationReason::Valley: return "valley";
    case TerminationReason::TunnelExit: return "tunnel_exit";
    case TerminationReason::TunnelExhausted: return "tunnel_exhausted";
    case TerminationReason::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool termination_explodes(TerminationReason reason) {
    switch (reason) {
    case TerminationReason::OutOfBounds:
    case TerminationReason::Absorbed:
    case TerminationReason::Split:
    case TerminationReason::Cancelled:
        return false;
    default:
        return true;
    }
}

Projectile::Projectile(u32 id, i32 owner,
                       std::shared_ptr<const blueprints::WeaponDef> weapon,
                       Vector2 position, Vector2 velocity, bool is_child)
    : id_(id),
      owner_(owner),
      weapon_(std::move(weapon)),
      is_child_(is_child),
      position_(position),
      state_(Flying{velocity.x, velocity.y, velocity.y}) {
    trail_.push_back(position_);
}

Vector2 Projectile::velocity() const {
    if (auto* f = std::get_if<Flying>(&state_)) return {f->vx, f->vy};
    if (auto* r = std::get_if<Rolling>(&state_)) return {r->velocity, 0};
    if (auto* t = std::get_if<Tunneling>(&state_)) {
        return {t->dir_x * t->speed, t->dir_y * t->speed};
    }
    return {};
}

std::optional<TerminationReason> Projectile::termination() const {
    if (auto* done = std::get_if<Inactive>(&state_)) return done->reason;
    return std::nullopt;
}

bool Projectile::start_rolling(const Rolling& roll) {
    if (!is_flying()) return false;
    state_ = roll;
    return true;
}

bool Projectile::start_tunneling(const Tunneling& tunnel) {
    if (!is_flying()) return false;
    state_ = tunnel;
    return true;
}

void Projectile::deactivate(TerminationReason reason) {
    if (!active()) return;
    state_ = Inactive{reason};
}

void Projectile::record_trail() {
    trail_.push_back(position_);
    while (trail_.size() > TRAIL_LENGTH) {
        trail_.pop_front();
    }
}

} // namespace scorch::sim
