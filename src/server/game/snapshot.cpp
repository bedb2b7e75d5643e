// SPDX-License-Identifier: Apache-2.0
#include "server/game/snapshot.hpp"

namespace astro::game {

namespace {

void set_vec(astro::Vec2 *out, b2Vec2 v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

void fill_effects(const Player &p, google::protobuf::RepeatedPtrField<astro::ActiveEffectState> *out)
{
    for (const auto &e : p.active_effects) {
        auto *ae = out->Add();
        ae->set_type(to_wire(e.type));
        ae->set_expires_at_ms(e.expires_at_ms == kNoExpiry ? 0 : e.expires_at_ms);
        ae->set_mega_bullets_remaining(e.mega_bullets_remaining);
    }
}

} // namespace

astro::PowerUpKind to_wire(PowerUpType type)
{
    switch (type) {
        case PowerUpType::AmmoBoost:
            return astro::AMMO_BOOST;
        case PowerUpType::SplitShot:
            return astro::SPLIT_SHOT;
        case PowerUpType::SpeedBoost:
            return astro::SPEED_BOOST;
        case PowerUpType::MineTrap:
            return astro::MINE_TRAP;
        case PowerUpType::Shield:
            return astro::SHIELD;
        case PowerUpType::RapidFire:
            return astro::RAPID_FIRE;
        case PowerUpType::GhostMode:
            return astro::GHOST_MODE;
        case PowerUpType::MegaBullet:
            return astro::MEGA_BULLET;
        case PowerUpType::TeleportDash:
            return astro::TELEPORT_DASH;
        case PowerUpType::ReverseControls:
            return astro::REVERSE_CONTROLS;
    }
    return astro::POWER_UP_UNSPECIFIED;
}

astro::RoundPhase to_wire(RoundPhase phase)
{
    switch (phase) {
        case RoundPhase::Waiting:
            return astro::PHASE_WAITING;
        case RoundPhase::Playing:
            return astro::PHASE_PLAYING;
        case RoundPhase::Ended:
            return astro::PHASE_ENDED;
    }
    return astro::PHASE_WAITING;
}

astro::KillCause to_wire(KillCause cause)
{
    return cause == KillCause::Mine ? astro::KILL_MINE : astro::KILL_BULLET;
}

void fill_snapshot(const GameState &state, uint64_t server_tick, astro::StateSnapshot *out)
{
    out->set_server_tick(server_tick);
    for (const auto &p : state.players) {
        auto *ps = out->add_players();
        ps->set_id(p.id);
        ps->set_name(p.name);
        set_vec(ps->mutable_position(), p.position);
        set_vec(ps->mutable_velocity(), p.velocity);
        ps->set_rotation(p.rotation);
        ps->set_color(p.color);
        ps->set_score(p.score);
        ps->set_ammo(p.ammo);
        ps->set_is_alive(p.is_alive);
        fill_effects(p, ps->mutable_active_effects());
        if (p.shield_hits > 0) {
            ps->set_shield_hits(p.shield_hits);
        }
        if (p.dash_charges > 0) {
            ps->set_dash_charges(p.dash_charges);
        }
        if (p.mines_available > 0) {
            ps->set_mines_available(p.mines_available);
        }
    }
    for (const auto &b : state.bullets) {
        auto *bs = out->add_bullets();
        bs->set_id(b.id);
        bs->set_player_id(b.player_id);
        set_vec(bs->mutable_position(), b.position);
        set_vec(bs->mutable_velocity(), b.velocity);
        bs->set_spawn_time_ms(b.spawn_time_ms);
        bs->set_is_mega(b.is_mega);
    }
    for (const auto &pu : state.power_ups) {
        auto *s = out->add_power_ups();
        s->set_id(pu.id);
        s->set_type(to_wire(pu.type));
        set_vec(s->mutable_position(), pu.position);
        s->set_spawn_time_ms(pu.spawn_time_ms);
    }
    for (const auto &m : state.mines) {
        auto *s = out->add_mines();
        s->set_id(m.id);
        s->set_player_id(m.player_id);
        set_vec(s->mutable_position(), m.position);
        s->set_spawn_time_ms(m.spawn_time_ms);
    }
    for (const auto &n : state.recent_pickups) {
        auto *s = out->add_recent_pickups();
        s->set_type(to_wire(n.type));
        set_vec(s->mutable_position(), n.position);
        s->set_timestamp_ms(n.timestamp_ms);
    }
    if (state.round_end_time_ms) {
        out->set_round_end_time_ms(*state.round_end_time_ms);
    }
    out->set_is_round_active(state.is_round_active);
    out->set_phase(to_wire(state.phase));
    if (state.host_player_id) {
        out->set_host_player_id(*state.host_player_id);
    }
}

void fill_personal_state(const GameState &state, const Player &p, astro::PersonalState *out)
{
    out->set_id(p.id);
    out->set_name(p.name);
    out->set_color(p.color);
    out->set_ammo(p.ammo);
    out->set_is_alive(p.is_alive);
    out->set_score(p.score);
    fill_effects(p, out->mutable_active_effects());
    if (p.shield_hits > 0) {
        out->set_shield_hits(p.shield_hits);
    }
    if (p.dash_charges > 0) {
        out->set_dash_charges(p.dash_charges);
    }
    if (p.mines_available > 0) {
        out->set_mines_available(p.mines_available);
    }
    out->set_phase(to_wire(state.phase));
    if (state.round_end_time_ms) {
        out->set_round_end_time_ms(*state.round_end_time_ms);
    }
    if (state.host_player_id) {
        out->set_host_player_id(*state.host_player_id);
    }
}

void fill_map_sync(const MapModel &map, astro::MapSync *out)
{
    out->set_name(map.name);
    out->set_grid_width(static_cast<uint32_t>(map.grid_width));
    out->set_grid_height(static_cast<uint32_t>(map.grid_height));
    out->set_block_size(map.block_size);
    for (const auto &b : map.blocks) {
        auto *cell = out->add_blocks();
        cell->set_grid_x(b.grid_x);
        cell->set_grid_y(b.grid_y);
    }
}

} // namespace astro::game
