// SPDX-License-Identifier: Apache-2.0
#include "server/game/physics.hpp"

#include <algorithm>
#include <cmath>

namespace astro::game {

float wrap_angle(float radians)
{
    float r = std::fmod(radians, kTwoPi);
    if (r < 0.f) {
        r += kTwoPi;
    }
    // fmod of a tiny negative value can round up to exactly 2pi
    if (r >= kTwoPi) {
        r = 0.f;
    }
    return r;
}

void wrap_to_field(b2Vec2 &p, float field_width, float field_height)
{
    if (p.x < 0.f) {
        p.x += field_width;
    } else if (p.x > field_width) {
        p.x -= field_width;
    }
    if (p.y < 0.f) {
        p.y += field_height;
    } else if (p.y > field_height) {
        p.y -= field_height;
    }
}

PhysicsEngine::PhysicsEngine()
{
    rebuild_spatial_index(MapModel{});
}

void PhysicsEngine::rebuild_spatial_index(const MapModel &map)
{
    grid_.clear();
    grid_width_ = map.grid_width;
    grid_height_ = map.grid_height;
    block_size_ = map.block_size;
    field_width_ = map.field_width();
    field_height_ = map.field_height();
    float half = block_size_ * 0.5f;
    block_shape_ = b2MakeBox(half, half);
    indexed_blocks_ = 0;
    for (const auto &b : map.blocks) {
        if (b.grid_x < 0 || b.grid_y < 0 || b.grid_x >= grid_width_ || b.grid_y >= grid_height_) {
            continue;
        }
        grid_[cell_key(b.grid_x, b.grid_y)].push_back(b);
        ++indexed_blocks_;
    }
}

std::optional<WallContact> PhysicsEngine::wall_contact(b2Vec2 center, float radius) const
{
    if (grid_.empty()) {
        return std::nullopt;
    }
    // Cells overlapped by the circle's bounding box, clamped to the grid.
    int32_t min_x = std::max(0, static_cast<int32_t>(std::floor((center.x - radius) / block_size_)));
    int32_t max_x = std::min(grid_width_ - 1, static_cast<int32_t>(std::floor((center.x + radius) / block_size_)));
    int32_t min_y = std::max(0, static_cast<int32_t>(std::floor((center.y - radius) / block_size_)));
    int32_t max_y = std::min(grid_height_ - 1, static_cast<int32_t>(std::floor((center.y + radius) / block_size_)));
    std::optional<WallContact> deepest;
    b2Circle circle{{0.f, 0.f}, radius};
    b2Transform circle_xf{center, b2Rot{1.f, 0.f}};
    for (int32_t cy = min_y; cy <= max_y; ++cy) {
        for (int32_t cx = min_x; cx <= max_x; ++cx) {
            auto it = grid_.find(cell_key(cx, cy));
            if (it == grid_.end()) {
                continue;
            }
            for (const auto &b : it->second) {
                b2Vec2 block_center{
                    (static_cast<float>(b.grid_x) + 0.5f) * block_size_,
                    (static_cast<float>(b.grid_y) + 0.5f) * block_size_};
                b2Transform block_xf{block_center, b2Rot{1.f, 0.f}};
                b2Manifold m = b2CollidePolygonAndCircle(&block_shape_, block_xf, &circle, circle_xf);
                if (m.pointCount > 0 && m.points[0].separation < 0.f) {
                    if (!deepest || m.points[0].separation < deepest->separation) {
                        deepest = WallContact{m.normal, m.points[0].separation};
                    }
                }
            }
        }
    }
    return deepest;
}

bool PhysicsEngine::is_obstructed(b2Vec2 center, float radius) const
{
    return wall_contact(center, radius).has_value();
}

void PhysicsEngine::update(SimContext &ctx, uint64_t now_ms)
{
    integrate_ships(ctx, now_ms);
    integrate_bullets(ctx, now_ms);
    resolve_bullet_hits(ctx);
    resolve_ship_contacts(ctx);
}

void PhysicsEngine::integrate_ships(SimContext &ctx, uint64_t now_ms) const
{
    const GameTuning &t = ctx.tuning;
    const float radius = t.ship_radius();
    for (auto &p : ctx.state.players) {
        if (!p.is_alive) {
            continue;
        }
        if (p.is_thrust_active) {
            bool boosted = p.has_effect(PowerUpType::SpeedBoost);
            float accel = t.acceleration * (boosted ? t.speed_boost_acceleration_multiplier : 1.f);
            float max_speed = t.max_speed * (boosted ? t.speed_boost_multiplier : 1.f);
            b2Vec2 heading{std::cos(p.rotation), std::sin(p.rotation)};
            p.velocity = b2MulAdd(p.velocity, accel, heading);
            float speed = b2Length(p.velocity);
            if (speed > max_speed) {
                p.velocity = b2MulSV(max_speed / speed, p.velocity);
            }
        } else {
            uint64_t elapsed = now_ms > p.turn_start_time_ms ? now_ms - p.turn_start_time_ms : 0;
            float ramp = t.turn_ramp_ms == 0
                ? 1.f
                : std::min(static_cast<float>(elapsed) / static_cast<float>(t.turn_ramp_ms), 1.f);
            p.rotation += t.turn_speed + (t.turn_speed_max - t.turn_speed) * ramp;
        }
        p.rotation = wrap_angle(p.rotation);
        p.velocity = b2MulSV(t.friction, p.velocity);

        b2Vec2 tentative = b2Add(p.position, p.velocity);
        if (auto contact = wall_contact(tentative, radius)) {
            // Bounce: reflect about the contact normal, damp, keep the old position.
            float vn = b2Dot(p.velocity, contact->normal);
            p.velocity = b2MulSV(t.wall_bounce_damping, b2MulSub(p.velocity, 2.f * vn, contact->normal));
            continue;
        }
        p.position = tentative;
        wrap_to_field(p.position, field_width_, field_height_);
    }
}

void PhysicsEngine::integrate_bullets(SimContext &ctx, uint64_t now_ms) const
{
    const GameTuning &t = ctx.tuning;
    auto &bullets = ctx.state.bullets;
    bullets.erase(
        std::remove_if(
            bullets.begin(),
            bullets.end(),
            [&](Bullet &b)
            {
                b.position = b2Add(b.position, b.velocity);
                if (now_ms >= b.spawn_time_ms + t.bullet_lifetime_ms) {
                    return true;
                }
                if (b.position.x < 0.f || b.position.y < 0.f || b.position.x > field_width_
                    || b.position.y > field_height_) {
                    return true;
                }
                return is_obstructed(b.position, b.is_mega ? t.mega_bullet_radius : t.bullet_radius);
            }),
        bullets.end());
}

void PhysicsEngine::resolve_bullet_hits(SimContext &ctx) const
{
    const GameTuning &t = ctx.tuning;
    const float ship_radius = t.ship_radius();
    auto &state = ctx.state;
    auto &bullets = state.bullets;
    bullets.erase(
        std::remove_if(
            bullets.begin(),
            bullets.end(),
            [&](const Bullet &b)
            {
                float hit_radius = ship_radius + (b.is_mega ? t.mega_bullet_radius : t.bullet_radius);
                for (auto &victim : state.players) {
                    if (!victim.is_alive || victim.id == b.player_id) {
                        continue;
                    }
                    if (b2Distance(victim.position, b.position) >= hit_radius) {
                        continue;
                    }
                    if (victim.shield_hits > 0) {
                        --victim.shield_hits;
                        return true;
                    }
                    victim.is_alive = false;
                    victim.is_thrust_active = false;
                    victim.velocity = {0.f, 0.f};
                    if (Player *shooter = state.find_player(b.player_id)) {
                        ++shooter->score;
                    }
                    state.kill_events.push_back(KillEvent{victim.id, b.player_id, KillCause::Bullet});
                    return true;
                }
                return false;
            }),
        bullets.end());
}

void PhysicsEngine::resolve_ship_contacts(SimContext &ctx) const
{
    const GameTuning &t = ctx.tuning;
    const float min_distance = t.collision_distance();
    auto &players = ctx.state.players;
    for (size_t i = 0; i < players.size(); ++i) {
        Player &a = players[i];
        if (!a.is_alive || a.has_effect(PowerUpType::GhostMode)) {
            continue;
        }
        for (size_t j = i + 1; j < players.size(); ++j) {
            Player &b = players[j];
            if (!b.is_alive || b.has_effect(PowerUpType::GhostMode)) {
                continue;
            }
            b2Vec2 delta = b2Sub(b.position, a.position);
            float distance = b2Length(delta);
            if (distance >= min_distance) {
                continue;
            }
            b2Vec2 n = distance > 1e-6f ? b2MulSV(1.f / distance, delta) : b2Vec2{1.f, 0.f};
            // Equal masses: exchange the normal component of the relative velocity, scaled by restitution.
            float approach = b2Dot(b2Sub(a.velocity, b.velocity), n);
            if (approach > 0.f) {
                float impulse = (1.f + t.restitution) * approach * 0.5f;
                a.velocity = b2MulSub(a.velocity, impulse, n);
                b.velocity = b2MulAdd(b.velocity, impulse, n);
            }
            float push = (min_distance - distance) * 0.5f;
            a.position = b2MulSub(a.position, push, n);
            b.position = b2MulAdd(b.position, push, n);
        }
    }
}

} // namespace astro::game
