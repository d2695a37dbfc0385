#include "sim/weapon_behavior.hpp"

#include "map/terrain.hpp"
#include "sim/boundary.hpp"
#include "sim/collision.hpp"
#include "sim/explosion.hpp"
#include "sim/tank.hpp"
#include "sim/trajectory.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <spdlog/spdlog.h>

namespace scorch::sim {

using blueprints::DiggingBehavior;
using blueprints::RollingBehavior;
using blueprints::SplittingBehavior;

namespace {

constexpr f32 DEG_TO_RAD = std::numbers::pi_v<f32> / 180.0f;
constexpr f32 RAD_TO_DEG = 180.0f / std::numbers::pi_v<f32>;

void terminate(Projectile& p, StepContext& ctx, TerminationReason reason) {
    p.deactivate(reason);
    ctx.report.terminations.push_back({p.id(), reason, p.position()});
    spdlog::debug("Projectile #{} ({}) terminated: {} at ({:.1f}, {:.1f})",
                  p.id(), p.weapon().id, termination_reason_name(reason),
                  p.position().x, p.position().y);
}

void detonate(Projectile& p, StepContext& ctx, Tank* direct_hit_tank,
              TerminationReason reason) {
    const auto& weapon = p.weapon();

    ExplosionRequest request;
    request.epicenter = p.position();
    request.radius = weapon.blast_radius;
    request.damage = weapon.damage;
    request.direct_hit_multiplier = weapon.effective_direct_hit_multiplier();
    request.direct_hit_tank = direct_hit_tank;
    request.terrain_effect = weapon.terrain_effect;
    request.attacker = p.owner();

    auto outcome = resolve_explosion(request, ctx.terrain, ctx.tanks);

    ExplosionEvent event;
    event.projectile_id = p.id();
    event.owner = p.owner();
    event.epicenter = p.position();
    event.radius = weapon.blast_radius;
    event.damage = weapon.damage;
    event.weapon = p.weapon_ptr();
    event.direct_hit_tank = direct_hit_tank;
    event.terrain_effect = weapon.terrain_effect;
    event.visuals = weapon.visuals;
    event.reason = reason;
    ctx.report.explosions.push_back(std::move(event));
    for (auto& dmg : outcome.damage) {
        ctx.report.damage.push_back(dmg);
    }

    terminate(p, ctx, reason);
}

f32 surface_at(const StepContext& ctx, f32 x, f32 fallback) {
    return ctx.terrain ? ctx.terrain->get_height(x) : fallback;
}

// Flying -> Rolling. The roller keeps half its horizontal impact speed.
void enter_rolling(Projectile& p, StepContext& ctx) {
    const auto* f = p.flying();
    f32 impact_vx = f->vx;

    Rolling roll;
    roll.start_time_ms = ctx.now_ms;
    roll.direction = (std::abs(impact_vx) < 0.1f || impact_vx > 0) ? 1 : -1;
    roll.velocity = std::max(std::abs(impact_vx) * ROLL_IMPACT_FACTOR,
                             MIN_ROLL_SPEED) * static_cast<f32>(roll.direction);

    f32 x = p.position().x;
    p.set_position(x, surface_at(ctx, x, p.position().y));
    p.start_rolling(roll);
    spdlog::debug("Projectile #{} started rolling at x={:.1f} (v={:.2f})",
                  p.id(), x, roll.velocity);
}

// Flying -> Tunneling along the impact direction.
void enter_tunneling(Projectile& p, StepContext& ctx, f32 tunnel_radius) {
    const auto* f = p.flying();
    f32 speed = std::hypot(f->vx, f->vy);

    Tunneling tunnel;
    if (speed < 1e-4f) {
        tunnel.dir_x = 0;
        tunnel.dir_y = 1;
    } else {
        tunnel.dir_x = f->vx / speed;
        tunnel.dir_y = f->vy / speed;
    }
    tunnel.speed = std::max(speed, MIN_TUNNEL_SPEED);
    p.start_tunneling(tunnel);

    if (ctx.terrain) {
        ctx.terrain->deform(p.position().x, p.position().y, tunnel_radius,
                            map::DeformKind::Tunnel);
    }
    spdlog::debug("Projectile #{} started tunnelling at ({:.1f}, {:.1f})",
                  p.id(), p.position().x, p.position().y);
}

void on_terrain_contact(Projectile& p, StepContext& ctx) {
    const auto& behavior = p.weapon().behavior;
    if (std::holds_alternative<RollingBehavior>(behavior)) {
        enter_rolling(p, ctx);
    } else if (auto* dig = std::get_if<DiggingBehavior>(&behavior)) {
        f32 radius = dig->tunnel_radius > 0 ? dig->tunnel_radius
                                            : blueprints::DEFAULT_TUNNEL_RADIUS;
        enter_tunneling(p, ctx, radius);
    } else {
        detonate(p, ctx, nullptr, TerminationReason::TerrainHit);
    }
}

void advance_flying(Projectile& p, StepContext& ctx) {
    auto* f = p.flying();
    const auto& config = ctx.config;

    KinematicState current{p.position().x, p.position().y, f->vx, f->vy};
    auto step = integrate(current, config);
    f->prev_vy = f->vy;
    f->vx = step.state.vx;
    f->vy = step.state.vy;
    p.set_position(step.state.x, step.state.y);

    if (config.wall_behavior != EdgeBehavior::None ||
        config.ceiling_behavior != EdgeBehavior::None) {
        auto edge = resolve_boundary(p.position().x, p.position().y, f->vx, f->vy,
                                     config.world_width, config.world_height,
                                     config.wall_behavior, config.ceiling_behavior);
        if (edge.hit) {
            u32 limit = p.weapon().bounce_count;
            bool out_of_bounces = edge.bounced && limit > 0 && p.bounces() >= limit;
            if (edge.absorbed || out_of_bounces) {
                terminate(p, ctx, TerminationReason::Absorbed);
                return;
            }
            if (edge.bounced) p.add_bounce();
            p.set_position(edge.x, edge.y);
            f->vx = edge.vx;
            f->vy = edge.vy;
        }
    }

    p.record_trail();

    auto oob = out_of_bounds(p.position().x, p.position().y, config.world_width,
                             config.world_height);
    if (oob != OutOfBoundsEdge::None) {
        spdlog::debug("Projectile #{} left the world ({})", p.id(),
                      out_of_bounds_edge_name(oob));
        terminate(p, ctx, TerminationReason::OutOfBounds);
        return;
    }

    // After the edges, so a ceiling bounce or wrap of a rising shell counts
    bool at_apex = f->prev_vy < 0 && f->vy >= 0;
    if (at_apex && try_split(p, ctx)) return;

    if (auto hit = tank_hit(p.position().x, p.position().y, ctx.tanks)) {
        detonate(p, ctx, hit->direct_hit ? hit->tank : nullptr,
                 TerminationReason::TankHit);
        return;
    }

    if (terrain_hit(ctx.terrain, p.position().x, p.position().y)) {
        on_terrain_contact(p, ctx);
    }
}

void advance_rolling(Projectile& p, StepContext& ctx) {
    auto* roll = p.rolling();

    f64 timeout = blueprints::DEFAULT_ROLL_TIMEOUT_MS;
    if (auto* rb = std::get_if<RollingBehavior>(&p.weapon().behavior)) {
        if (rb->roll_timeout_ms > 0) timeout = rb->roll_timeout_ms;
    }
    if (ctx.now_ms - roll->start_time_ms >= timeout) {
        detonate(p, ctx, nullptr, TerminationReason::Timeout);
        return;
    }

    f32 x = p.position().x;
    f32 dir = static_cast<f32>(roll->direction);
    f32 here = surface_at(ctx, x, p.position().y);
    f32 ahead = surface_at(ctx, x + ROLL_LOOKAHEAD * dir, p.position().y);

    // Y grows downward: positive height_diff means the ground drops away.
    f32 height_diff = ahead - here;
    f32 slope = std::atan2(height_diff, ROLL_LOOKAHEAD);
    roll->velocity += std::sin(slope) * ROLL_GRAVITY * dir;

    f32 next_x = x + roll->velocity;
    if (next_x < 0 || next_x > ctx.config.world_width) {
        detonate(p, ctx, nullptr, TerminationReason::Wall);
        return;
    }

    if (std::abs(roll->velocity) < MIN_ROLL_SPEED && height_diff < -VALLEY_THRESHOLD) {
        detonate(p, ctx, nullptr, TerminationReason::Valley);
        return;
    }

    roll->velocity = dir * std::clamp(std::abs(roll->velocity), MIN_ROLL_SPEED,
                                      MAX_ROLL_SPEED);
    roll->rotation += roll->velocity / ROLLER_RADIUS;

    x += roll->velocity;
    p.set_position(x, surface_at(ctx, x, p.position().y));
    p.record_trail();

    if (auto hit = tank_hit(x, p.position().y - ROLL_CONTACT_HEIGHT, ctx.tanks)) {
        detonate(p, ctx, hit->direct_hit ? hit->tank : nullptr,
                 TerminationReason::TankHit);
    }
}

void advance_tunneling(Projectile& p, StepContext& ctx) {
    auto* tunnel = p.tunneling();

    f32 distance = blueprints::DEFAULT_TUNNEL_DISTANCE;
    f32 radius = blueprints::DEFAULT_TUNNEL_RADIUS;
    if (auto* dig = std::get_if<DiggingBehavior>(&p.weapon().behavior)) {
        if (dig->tunnel_distance > 0) distance = dig->tunnel_distance;
        if (dig->tunnel_radius > 0) radius = dig->tunnel_radius;
    }

    f32 move = std::min(tunnel->speed, std::max(0.0f, distance - tunnel->travelled));
    f32 x = p.position().x + tunnel->dir_x * move;
    f32 y = p.position().y + tunnel->dir_y * move;
    tunnel->travelled += move;
    bool exhausted = tunnel->travelled >= distance - 1e-4f;

    p.set_position(x, y);
    p.record_trail();

    if (out_of_bounds(x, y, ctx.config.world_width, ctx.config.world_height) !=
        OutOfBoundsEdge::None) {
        terminate(p, ctx, TerminationReason::OutOfBounds);
        return;
    }

    if (auto hit = tank_hit(x, y, ctx.tanks)) {
        detonate(p, ctx, hit->direct_hit ? hit->tank : nullptr,
                 TerminationReason::TankHit);
        return;
    }

    if (!ctx.terrain || y < ctx.terrain->get_height(x)) {
        detonate(p, ctx, nullptr, TerminationReason::TunnelExit);
        return;
    }

    ctx.terrain->deform(x, y, radius, map::DeformKind::Tunnel);

    if (exhausted) {
        detonate(p, ctx, nullptr, TerminationReason::TunnelExhausted);
    }
}

} // namespace

std::vector<f32> split_directions(f32 parent_vx, f32 parent_vy, u32 count,
                                  f32 spread_deg) {
    std::vector<f32> result;
    if (count == 0) return result;
    result.reserve(count);

    f32 base = std::atan2(parent_vy, parent_vx) * RAD_TO_DEG;
    if (count == 1) {
        result.push_back(base);
        return result;
    }
    f32 step = spread_deg / static_cast<f32>(count - 1);
    f32 first = -spread_deg / 2.0f;
    for (u32 i = 0; i < count; i++) {
        result.push_back(base + first + step * static_cast<f32>(i));
    }
    return result;
}

f32 split_child_speed(f32 parent_vx, f32 parent_speed) {
    return std::max({std::abs(parent_vx) * SPLIT_SPEED_FACTOR,
                     parent_speed * SPLIT_SPEED_FACTOR, MIN_CHILD_SPEED});
}

bool try_split(Projectile& p, StepContext& ctx) {
    const auto* split = std::get_if<SplittingBehavior>(&p.weapon().behavior);
    if (!split || split->split_count == 0) return false;
    if (p.is_child() || p.has_split() || !p.is_flying()) return false;

    const auto* f = p.flying();
    f32 spread = split->split_angle > 0 ? split->split_angle
                                        : blueprints::DEFAULT_SPLIT_ANGLE;
    f32 speed = split_child_speed(f->vx, std::hypot(f->vx, f->vy));
    u32 count = std::min(split->split_count, blueprints::MAX_SPLIT_COUNT);
    auto directions = split_directions(f->vx, f->vy, count, spread);

    p.mark_split();
    for (f32 angle_deg : directions) {
        f32 angle = angle_deg * DEG_TO_RAD;
        Vector2 velocity{std::cos(angle) * speed, std::sin(angle) * speed};
        velocity.y = std::max(velocity.y, MIN_CHILD_DOWNWARD_VY);

        u32 id = ctx.next_projectile_id++;
        ctx.spawned.push_back(std::make_unique<Projectile>(
            id, p.owner(), p.weapon_ptr(), p.position(), velocity, true));
        ctx.report.spawned.push_back(id);
    }
    spdlog::debug("Projectile #{} ({}) split into {} warheads", p.id(),
                  p.weapon().id, directions.size());

    terminate(p, ctx, TerminationReason::Split);
    return true;
}

void advance_projectile(Projectile& projectile, StepContext& ctx) {
    if (projectile.is_flying()) {
        advance_flying(projectile, ctx);
    } else if (projectile.is_rolling()) {
        advance_rolling(projectile, ctx);
    } else if (projectile.is_tunneling()) {
        advance_tunneling(projectile, ctx);
    }
}

} // namespace scorch::sim
