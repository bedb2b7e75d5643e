// SPDX-License-Identifier: Apache-2.0
#include "server/game/input_handler.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <cmath>

namespace astro::game {

namespace {

bool is_known_action(int action)
{
    switch (action) {
        case astro::THRUST_START:
        case astro::THRUST_STOP:
        case astro::FIRE:
        case astro::PLACE_MINE:
        case astro::DASH:
            return true;
        default:
            return false;
    }
}

} // namespace

bool InputHandler::handle(SimContext &ctx, const astro::InputEvent &ev, uint64_t now_ms)
{
    auto reject = [&](const char *why)
    {
        astro::metrics::runtime().inputs_rejected.fetch_add(1, std::memory_order_relaxed);
        astro::log::debug("[input] drop player={} action={} reason={}", ev.player_id(), static_cast<int>(ev.action()), why);
        return false;
    };
    if (!is_known_action(ev.action())) {
        return reject("unknown_action");
    }
    if (ev.timestamp_ms() < 0) {
        return reject("bad_timestamp");
    }
    if (ctx.state.phase != RoundPhase::Playing) {
        return reject("phase");
    }
    Player *p = ctx.state.find_player(ev.player_id());
    if (!p) {
        return reject("unknown_player");
    }
    if (!p->is_alive) {
        return reject("dead");
    }
    switch (ev.action()) {
        case astro::THRUST_START:
        case astro::THRUST_STOP: {
            bool thrust = ev.action() == astro::THRUST_START;
            if (p->has_effect(PowerUpType::ReverseControls)) {
                thrust = !thrust;
            }
            set_thrust(*p, thrust, now_ms);
            return true;
        }
        case astro::FIRE:
            return fire(ctx, *p, now_ms);
        case astro::PLACE_MINE:
            return effects_.place_mine(ctx, p->id, now_ms);
        case astro::DASH:
            return effects_.dash(ctx, p->id);
        default:
            return false;
    }
}

void InputHandler::set_thrust(Player &p, bool thrust, uint64_t now_ms) const
{
    p.is_thrust_active = thrust;
    // Rotation ramps up again from the base rate whenever the mode changes.
    p.turn_start_time_ms = now_ms;
}

bool InputHandler::fire(SimContext &ctx, Player &p, uint64_t now_ms) const
{
    if (p.ammo == 0) {
        return false;
    }
    const GameTuning &t = ctx.tuning;
    --p.ammo;
    // Every shot below the base clip restarts the reload interval.
    if (p.ammo < t.clip_size) {
        p.last_reload_time_ms = now_ms;
    }

    bool mega = false;
    if (ActiveEffect *e = p.find_effect(PowerUpType::MegaBullet); e && e->mega_bullets_remaining > 0) {
        mega = true;
        --e->mega_bullets_remaining;
    }
    float speed = t.bullet_speed * (mega ? t.mega_bullet_speed_multiplier : 1.f);
    b2Vec2 nose = b2MulAdd(p.position, t.ship_size * 0.6f, b2Vec2{std::cos(p.rotation), std::sin(p.rotation)});

    auto spawn = [&](float angle)
    {
        Bullet b;
        b.id = ctx.state.next_id("b");
        b.player_id = p.id;
        b.position = nose;
        b.velocity = b2MulAdd(p.velocity, speed, b2Vec2{std::cos(angle), std::sin(angle)});
        b.spawn_time_ms = now_ms;
        b.is_mega = mega;
        ctx.state.bullets.push_back(std::move(b));
    };
    if (p.has_effect(PowerUpType::SplitShot)) {
        spawn(p.rotation - t.split_shot_spread_rad);
        spawn(p.rotation);
        spawn(p.rotation + t.split_shot_spread_rad);
    } else {
        spawn(p.rotation);
    }
    return true;
}

} // namespace astro::game
