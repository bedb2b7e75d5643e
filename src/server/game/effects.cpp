// SPDX-License-Identifier: Apache-2.0
#include "server/game/effects.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>

namespace astro::game {

namespace {

void grant_timed(Player &p, PowerUpType type, uint64_t expires_at_ms)
{
    if (ActiveEffect *e = p.find_effect(type)) {
        e->expires_at_ms = expires_at_ms;
        return;
    }
    p.active_effects.push_back(ActiveEffect{type, expires_at_ms, 0});
}

} // namespace

uint32_t EffectManager::max_ammo(const Player &p, const GameTuning &t)
{
    return p.has_effect(PowerUpType::AmmoBoost) ? t.ammo_boost_size : t.clip_size;
}

float EffectManager::reload_multiplier(const Player &p, const GameTuning &t)
{
    if (p.has_effect(PowerUpType::AmmoBoost)) {
        return t.ammo_boost_reload_multiplier;
    }
    if (p.has_effect(PowerUpType::RapidFire)) {
        return t.rapid_fire_reload_multiplier;
    }
    return 1.f;
}

void EffectManager::update(SimContext &ctx, uint64_t now_ms)
{
    auto &state = ctx.state;
    if (state.is_round_active && state.power_ups.size() < ctx.tuning.max_power_ups
        && now_ms >= last_spawn_ms_ + ctx.tuning.power_up_spawn_interval_ms) {
        spawn_power_up(ctx, now_ms);
    }
    const uint64_t lifetime = ctx.tuning.power_up_lifetime_ms;
    state.power_ups.erase(
        std::remove_if(
            state.power_ups.begin(),
            state.power_ups.end(),
            [&](const PowerUp &pu) { return now_ms >= pu.spawn_time_ms + lifetime; }),
        state.power_ups.end());
    collect_power_ups(ctx, now_ms);
    sweep_effects(ctx, now_ms);
    update_mines(ctx, now_ms);
}

bool EffectManager::spawn_power_up(SimContext &ctx, uint64_t now_ms)
{
    auto &state = ctx.state;
    if (state.power_ups.size() >= ctx.tuning.max_power_ups) {
        return false;
    }
    std::uniform_int_distribution<size_t> pick(0, kAllPowerUpTypes.size() - 1);
    PowerUp pu;
    pu.id = state.next_id("pu");
    pu.type = kAllPowerUpTypes[pick(ctx.rng)];
    pu.position = random_open_position(ctx, ctx.tuning.power_up_radius);
    pu.spawn_time_ms = now_ms;
    astro::log::debug("[effects] spawn {} {} at ({}, {})", pu.id, power_up_name(pu.type), pu.position.x, pu.position.y);
    state.power_ups.push_back(std::move(pu));
    last_spawn_ms_ = now_ms;
    return true;
}

b2Vec2 EffectManager::random_open_position(SimContext &ctx, float radius) const
{
    const MapModel &map = ctx.state.map;
    float w = map.field_width();
    float h = map.field_height();
    std::uniform_real_distribution<float> dx(radius, std::max(radius, w - radius));
    std::uniform_real_distribution<float> dy(radius, std::max(radius, h - radius));
    for (uint32_t attempt = 0; attempt < ctx.tuning.power_up_spawn_attempts; ++attempt) {
        b2Vec2 candidate{dx(ctx.rng), dy(ctx.rng)};
        if (!physics_.is_obstructed(candidate, radius)) {
            return candidate;
        }
    }
    astro::log::warn("[effects] no open power-up position after {} attempts, using field centre",
                     ctx.tuning.power_up_spawn_attempts);
    return {w * 0.5f, h * 0.5f};
}

void EffectManager::collect_power_ups(SimContext &ctx, uint64_t now_ms)
{
    auto &state = ctx.state;
    const float pickup_distance = ctx.tuning.power_up_radius + ctx.tuning.ship_radius();
    for (size_t i = 0; i < state.power_ups.size();) {
        PowerUp pu = state.power_ups[i];
        Player *picker = nullptr;
        for (auto &p : state.players) {
            if (p.is_alive && b2Distance(p.position, pu.position) < pickup_distance) {
                picker = &p;
                break;
            }
        }
        if (!picker) {
            ++i;
            continue;
        }
        state.power_ups.erase(state.power_ups.begin() + static_cast<std::ptrdiff_t>(i));
        astro::log::debug("[effects] {} picked up {}", picker->id, power_up_name(pu.type));
        apply_power_up(ctx, *picker, pu.type, now_ms);
        state.recent_pickups.push_back(PickupNotice{pu.type, pu.position, now_ms});
        while (state.recent_pickups.size() > ctx.tuning.max_pickup_notices) {
            state.recent_pickups.pop_front();
        }
    }
}

void EffectManager::apply_power_up(SimContext &ctx, Player &picker, PowerUpType type, uint64_t now_ms)
{
    const GameTuning &t = ctx.tuning;
    switch (type) {
        case PowerUpType::AmmoBoost:
            picker.ammo = t.ammo_boost_size;
            grant_timed(picker, type, now_ms + t.ammo_boost_ms);
            break;
        case PowerUpType::SplitShot:
            grant_timed(picker, type, now_ms + t.split_shot_ms);
            break;
        case PowerUpType::SpeedBoost:
            grant_timed(picker, type, now_ms + t.speed_boost_ms);
            break;
        case PowerUpType::RapidFire:
            grant_timed(picker, type, now_ms + t.rapid_fire_ms);
            break;
        case PowerUpType::GhostMode:
            grant_timed(picker, type, now_ms + t.ghost_mode_ms);
            break;
        case PowerUpType::MineTrap:
            picker.mines_available += t.mine_trap_count;
            break;
        case PowerUpType::Shield:
            picker.shield_hits = t.shield_max_hits;
            grant_timed(picker, type, kNoExpiry);
            break;
        case PowerUpType::MegaBullet:
            if (ActiveEffect *e = picker.find_effect(type)) {
                e->mega_bullets_remaining = t.mega_bullet_count;
            } else {
                picker.active_effects.push_back(ActiveEffect{type, kNoExpiry, t.mega_bullet_count});
            }
            break;
        case PowerUpType::TeleportDash:
            picker.dash_charges += t.dash_charges;
            break;
        case PowerUpType::ReverseControls: {
            std::vector<Player *> targets;
            for (auto &p : ctx.state.players) {
                if (p.is_alive && p.id != picker.id) {
                    targets.push_back(&p);
                }
            }
            if (targets.empty()) {
                break;
            }
            std::uniform_int_distribution<size_t> pick(0, targets.size() - 1);
            Player *target = targets[pick(ctx.rng)];
            grant_timed(*target, type, now_ms + t.reverse_controls_ms);
            astro::log::debug("[effects] {} reversed controls of {}", picker.id, target->id);
            break;
        }
    }
}

void EffectManager::sweep_effects(SimContext &ctx, uint64_t now_ms) const
{
    for (auto &p : ctx.state.players) {
        p.active_effects.erase(
            std::remove_if(
                p.active_effects.begin(),
                p.active_effects.end(),
                [&](const ActiveEffect &e)
                {
                    if (e.expires_at_ms != kNoExpiry && now_ms >= e.expires_at_ms) {
                        return true;
                    }
                    if (e.type == PowerUpType::MegaBullet && e.mega_bullets_remaining == 0) {
                        return true;
                    }
                    return e.type == PowerUpType::Shield && p.shield_hits == 0;
                }),
            p.active_effects.end());
        if (!p.has_effect(PowerUpType::Shield)) {
            p.shield_hits = 0;
        }
    }
}

void EffectManager::update_mines(SimContext &ctx, uint64_t now_ms) const
{
    auto &state = ctx.state;
    const uint64_t lifetime = ctx.tuning.mine_lifetime_ms;
    const float trigger_distance = ctx.tuning.mine_radius + ctx.tuning.ship_radius();
    state.mines.erase(
        std::remove_if(
            state.mines.begin(),
            state.mines.end(),
            [&](const Mine &m) { return now_ms >= m.spawn_time_ms + lifetime; }),
        state.mines.end());
    for (size_t i = 0; i < state.mines.size();) {
        const Mine &m = state.mines[i];
        bool triggered = std::any_of(
            state.players.begin(),
            state.players.end(),
            [&](const Player &p)
            { return p.is_alive && p.id != m.player_id && b2Distance(p.position, m.position) < trigger_distance; });
        if (!triggered) {
            ++i;
            continue;
        }
        Mine fired = m;
        state.mines.erase(state.mines.begin() + static_cast<std::ptrdiff_t>(i));
        detonate(ctx, fired);
    }
}

void EffectManager::detonate(SimContext &ctx, const Mine &mine) const
{
    auto &state = ctx.state;
    uint32_t kills = 0;
    for (auto &p : state.players) {
        if (!p.is_alive || p.id == mine.player_id) {
            continue;
        }
        if (b2Distance(p.position, mine.position) >= ctx.tuning.mine_explosion_radius) {
            continue;
        }
        if (p.shield_hits > 0) {
            --p.shield_hits;
            continue;
        }
        p.is_alive = false;
        p.is_thrust_active = false;
        p.velocity = {0.f, 0.f};
        state.kill_events.push_back(KillEvent{p.id, mine.player_id, KillCause::Mine});
        ++kills;
    }
    if (kills > 0) {
        if (Player *owner = state.find_player(mine.player_id)) {
            owner->score += kills;
        }
    }
    astro::log::debug("[effects] mine {} detonated kills={}", mine.id, kills);
}

bool EffectManager::place_mine(SimContext &ctx, std::string_view player_id, uint64_t now_ms)
{
    Player *p = ctx.state.find_player(player_id);
    if (!p || !p->is_alive || p->mines_available == 0) {
        return false;
    }
    --p->mines_available;
    ctx.state.mines.push_back(Mine{ctx.state.next_id("m"), p->id, p->position, now_ms});
    return true;
}

bool EffectManager::dash(SimContext &ctx, std::string_view player_id)
{
    Player *p = ctx.state.find_player(player_id);
    if (!p || !p->is_alive || p->dash_charges == 0) {
        return false;
    }
    --p->dash_charges;
    const GameTuning &t = ctx.tuning;
    float speed = b2Length(p->velocity);
    b2Vec2 dir = speed > t.dash_min_speed ? b2MulSV(1.f / speed, p->velocity)
                                          : b2Vec2{std::cos(p->rotation), std::sin(p->rotation)};
    p->position = b2MulAdd(p->position, t.dash_distance, dir);
    wrap_to_field(p->position, ctx.state.map.field_width(), ctx.state.map.field_height());
    return true;
}

void EffectManager::clear_round(SimContext &ctx, uint64_t now_ms)
{
    ctx.state.power_ups.clear();
    ctx.state.mines.clear();
    last_spawn_ms_ = now_ms;
}

} // namespace astro::game
