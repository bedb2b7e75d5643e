// SPDX-License-Identifier: Apache-2.0
#include "server/game/simulation.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/snapshot.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace astro::game {

Simulation::Simulation(SimulationConfig cfg, std::shared_ptr<const MapCatalog> maps, Egress &egress)
    : cfg_(std::move(cfg))
    , maps_(std::move(maps))
    , egress_(egress)
    , effects_(physics_)
    , input_(effects_)
{
    if (!maps_ || maps_->empty()) {
        throw std::runtime_error("simulation requires at least one map");
    }
    ctx_.tuning = cfg_.tuning;
    ctx_.rng.seed(cfg_.fixed_seed ? *cfg_.fixed_seed : std::random_device{}());
}

float Simulation::random_heading()
{
    std::uniform_real_distribution<float> dist(0.f, kTwoPi);
    return wrap_angle(dist(ctx_.rng));
}

b2Vec2 Simulation::find_spawn_position()
{
    const MapModel &map = ctx_.state.map;
    const float r = ctx_.tuning.ship_radius();
    const float w = map.field_width();
    const float h = map.field_height();
    std::uniform_real_distribution<float> dx(r, std::max(r, w - r));
    std::uniform_real_distribution<float> dy(r, std::max(r, h - r));
    for (uint32_t attempt = 0; attempt < ctx_.tuning.spawn_attempts; ++attempt) {
        b2Vec2 candidate{dx(ctx_.rng), dy(ctx_.rng)};
        if (!physics_.is_obstructed(candidate, r)) {
            return candidate;
        }
    }
    std::vector<b2Vec2> centres;
    for (int32_t gy = 1; gy + 1 < map.grid_height; ++gy) {
        for (int32_t gx = 1; gx + 1 < map.grid_width; ++gx) {
            centres.push_back(
                {(static_cast<float>(gx) + 0.5f) * map.block_size, (static_cast<float>(gy) + 0.5f) * map.block_size});
        }
    }
    std::shuffle(centres.begin(), centres.end(), ctx_.rng);
    for (const auto &c : centres) {
        if (!physics_.is_obstructed(c, r)) {
            astro::log::warn("[sim] random spawn failed on map {}, using grid centre", map.name);
            return c;
        }
    }
    astro::log::error("[sim] no free spawn position on map {}, using emergency position", map.name);
    return {ctx_.tuning.emergency_spawn_x, ctx_.tuning.emergency_spawn_y};
}

std::optional<std::string> Simulation::join(const std::string &name, uint64_t now_ms)
{
    auto &s = ctx_.state;
    if (s.players.size() >= cfg_.max_players) {
        astro::log::warn("[sim] join rejected name={} room full ({})", name, s.players.size());
        return std::nullopt;
    }
    Player p;
    p.id = "p" + std::to_string(++player_seq_);
    p.name = name.empty() ? "Pilot " + std::to_string(player_seq_) : name;
    p.color = player_color(player_seq_ - 1);
    p.position = find_spawn_position();
    p.rotation = random_heading();
    p.ammo = ctx_.tuning.clip_size;
    p.last_reload_time_ms = now_ms;
    p.turn_start_time_ms = now_ms;
    std::string id = p.id;
    s.players.push_back(std::move(p));
    if (!s.host_player_id) {
        s.host_player_id = id;
    }
    astro::log::info("[sim] join id={} name={} players={} host={}", id, name, s.players.size(), *s.host_player_id);
    astro::ServerMessage msg;
    auto *pj = msg.mutable_player_joined();
    pj->set_player_id(id);
    pj->set_name(s.players.back().name);
    egress_.to_all(msg);
    return id;
}

bool Simulation::leave(const std::string &player_id)
{
    auto &s = ctx_.state;
    auto it = std::find_if(s.players.begin(), s.players.end(), [&](const Player &p) { return p.id == player_id; });
    if (it == s.players.end()) {
        return false;
    }
    if (auto tok = ctx_.respawn_tokens.find(player_id); tok != ctx_.respawn_tokens.end()) {
        ctx_.timers.cancel(tok->second);
        ctx_.respawn_tokens.erase(tok);
    }
    s.players.erase(it);
    s.bullets.erase(
        std::remove_if(s.bullets.begin(), s.bullets.end(), [&](const Bullet &b) { return b.player_id == player_id; }),
        s.bullets.end());
    s.mines.erase(
        std::remove_if(s.mines.begin(), s.mines.end(), [&](const Mine &m) { return m.player_id == player_id; }),
        s.mines.end());
    last_sent_personal_.erase(player_id);
    if (s.host_player_id && *s.host_player_id == player_id) {
        if (s.players.empty()) {
            s.host_player_id.reset();
        } else {
            s.host_player_id = s.players.front().id;
        }
        astro::log::info("[sim] host left, new host={}", s.host_player_id.value_or("none"));
    }
    astro::log::info("[sim] leave id={} players={}", player_id, s.players.size());
    astro::ServerMessage msg;
    msg.mutable_player_left()->set_player_id(player_id);
    egress_.to_all(msg);
    if (s.players.empty() && s.phase == RoundPhase::Playing) {
        end_round();
    }
    return true;
}

bool Simulation::handle_input(const astro::InputEvent &ev, uint64_t now_ms)
{
    return input_.handle(ctx_, ev, now_ms);
}

bool Simulation::start_round(const std::string &requester_id, uint64_t now_ms)
{
    const auto &s = ctx_.state;
    if (s.phase != RoundPhase::Waiting) {
        astro::log::warn("[sim] start rejected by {}: phase {}", requester_id, phase_name(s.phase));
        return false;
    }
    if (!s.host_player_id || *s.host_player_id != requester_id) {
        astro::log::warn("[sim] start rejected by {}: not host", requester_id);
        return false;
    }
    if (s.players.empty()) {
        astro::log::warn("[sim] start rejected: no players");
        return false;
    }
    begin_round(now_ms);
    return true;
}

bool Simulation::reset_round(const std::string &requester_id, uint64_t now_ms)
{
    auto &s = ctx_.state;
    if (s.phase != RoundPhase::Ended) {
        astro::log::warn("[sim] reset rejected by {}: phase {}", requester_id, phase_name(s.phase));
        return false;
    }
    if (!s.find_player(requester_id)) {
        astro::log::warn("[sim] reset rejected: {} is not connected", requester_id);
        return false;
    }
    begin_round(now_ms);
    return true;
}

void Simulation::begin_round(uint64_t now_ms)
{
    auto &s = ctx_.state;
    s.map = maps_->pick_random(ctx_.rng);
    physics_.rebuild_spatial_index(s.map);
    ctx_.timers.clear();
    ctx_.respawn_tokens.clear();
    s.bullets.clear();
    s.recent_pickups.clear();
    s.kill_events.clear();
    effects_.clear_round(ctx_, now_ms);
    s.phase = RoundPhase::Playing;
    s.is_round_active = true;
    s.round_end_time_ms = now_ms + cfg_.round_duration_ms;
    for (auto &p : s.players) {
        p.score = 0;
        p.is_alive = true;
        p.position = find_spawn_position();
        p.velocity = {0.f, 0.f};
        p.rotation = random_heading();
        p.is_thrust_active = false;
        p.turn_start_time_ms = now_ms;
        p.ammo = ctx_.tuning.clip_size;
        p.last_reload_time_ms = now_ms;
        p.active_effects.clear();
        p.shield_hits = 0;
        p.dash_charges = 0;
        p.mines_available = 0;
    }
    last_sent_personal_.clear();
    astro::metrics::runtime().rounds_started.fetch_add(1, std::memory_order_relaxed);
    astro::log::info(
        "[sim] round start map={} players={} ends_at={}", s.map.name, s.players.size(), *s.round_end_time_ms);

    astro::ServerMessage sync;
    fill_map_sync(s.map, sync.mutable_map_sync());
    astro::metrics::snapshot().map_sync_count.fetch_add(1, std::memory_order_relaxed);
    egress_.to_displays(sync);
    astro::ServerMessage start;
    start.mutable_round_start()->set_round_end_time_ms(*s.round_end_time_ms);
    start.mutable_round_start()->set_map_name(s.map.name);
    egress_.to_all(start);
}

void Simulation::end_round()
{
    auto &s = ctx_.state;
    s.phase = RoundPhase::Ended;
    s.is_round_active = false;
    s.round_end_time_ms.reset();
    const Player *winner = nullptr;
    for (const auto &p : s.players) {
        if (!winner || p.score > winner->score) {
            winner = &p;
        }
    }
    astro::ServerMessage msg;
    auto *re = msg.mutable_round_end();
    if (winner) {
        re->mutable_winner()->set_id(winner->id);
        re->mutable_winner()->set_name(winner->name);
        re->mutable_winner()->set_score(winner->score);
        astro::log::info("[sim] round end winner={} score={}", winner->id, winner->score);
    } else {
        astro::log::info("[sim] round end with empty room");
    }
    egress_.to_all(msg);
}

void Simulation::reload_ammo(uint64_t now_ms)
{
    for (auto &p : ctx_.state.players) {
        uint32_t cap = EffectManager::max_ammo(p, ctx_.tuning);
        if (p.ammo > cap) {
            p.ammo = cap;
        }
        if (p.ammo >= cap) {
            continue;
        }
        auto interval = static_cast<uint64_t>(
            static_cast<float>(ctx_.tuning.reload_ms) * EffectManager::reload_multiplier(p, ctx_.tuning));
        if (now_ms >= p.last_reload_time_ms + interval) {
            ++p.ammo;
            p.last_reload_time_ms = now_ms;
        }
    }
}

void Simulation::publish_kills(uint64_t now_ms)
{
    auto &events = ctx_.state.kill_events;
    if (events.empty()) {
        return;
    }
    astro::ServerMessage msg;
    auto *feed = msg.mutable_kill_feed();
    feed->set_server_tick(server_tick_);
    for (const auto &ev : events) {
        auto *e = feed->add_events();
        e->set_victim_id(ev.victim_id);
        e->set_killer_id(ev.killer_id);
        e->set_cause(to_wire(ev.cause));
        astro::log::info("[sim] kill victim={} killer={} cause={}", ev.victim_id, ev.killer_id,
                         ev.cause == KillCause::Mine ? "mine" : "bullet");
        schedule_respawn(ev.victim_id, now_ms);
    }
    astro::metrics::runtime().kills_total.fetch_add(events.size(), std::memory_order_relaxed);
    events.clear();
    egress_.to_all(msg);
}

void Simulation::schedule_respawn(const std::string &player_id, uint64_t now_ms)
{
    if (auto tok = ctx_.respawn_tokens.find(player_id); tok != ctx_.respawn_tokens.end()) {
        ctx_.timers.cancel(tok->second);
    }
    uint64_t due = now_ms + ctx_.tuning.respawn_delay_ms;
    ctx_.respawn_tokens[player_id] = ctx_.timers.schedule_at(
        due,
        [this, player_id, due]
        {
            ctx_.respawn_tokens.erase(player_id);
            respawn(player_id, due);
        });
}

void Simulation::respawn(const std::string &player_id, uint64_t now_ms)
{
    Player *p = ctx_.state.find_player(player_id);
    if (!p) {
        return;
    }
    b2Vec2 pos = find_spawn_position();
    p->is_alive = true;
    p->position = pos;
    p->velocity = {0.f, 0.f};
    p->rotation = random_heading();
    p->is_thrust_active = false;
    p->turn_start_time_ms = now_ms;
    astro::log::debug("[sim] respawn {} at ({}, {})", player_id, pos.x, pos.y);
}

void Simulation::prune_pickups(uint64_t now_ms)
{
    auto &log = ctx_.state.recent_pickups;
    const uint64_t ttl = ctx_.tuning.pickup_notice_ttl_ms;
    while (!log.empty() && now_ms >= log.front().timestamp_ms + ttl) {
        log.pop_front();
    }
}

void Simulation::broadcast()
{
    const auto &s = ctx_.state;
    astro::ServerMessage full;
    fill_snapshot(s, server_tick_, full.mutable_snapshot());
    astro::metrics::add_full(full.ByteSizeLong());
    egress_.to_displays(full);

    personal_sent_.clear();
    for (const auto &p : s.players) {
        astro::ServerMessage msg;
        fill_personal_state(s, p, msg.mutable_personal());
        std::string bytes = msg.personal().SerializeAsString();
        auto cached = last_sent_personal_.find(p.id);
        if (cached != last_sent_personal_.end() && cached->second == bytes) {
            continue;
        }
        astro::metrics::add_personal(bytes.size());
        egress_.to_player(p.id, msg);
        last_sent_personal_[p.id] = std::move(bytes);
        personal_sent_.push_back(p.id);
    }
}

void Simulation::update_gauges() const
{
    auto &rt = astro::metrics::runtime();
    const auto &s = ctx_.state;
    rt.connected_players.store(s.players.size(), std::memory_order_relaxed);
    rt.bullets_active.store(s.bullets.size(), std::memory_order_relaxed);
    rt.power_ups_active.store(s.power_ups.size(), std::memory_order_relaxed);
    rt.mines_active.store(s.mines.size(), std::memory_order_relaxed);
}

void Simulation::tick(uint64_t now_ms)
{
    ++server_tick_;
    try {
        ctx_.timers.run_due(now_ms);
        if (ctx_.state.phase == RoundPhase::Playing) {
            physics_.update(ctx_, now_ms);
            effects_.update(ctx_, now_ms);
            reload_ammo(now_ms);
            publish_kills(now_ms);
        }
        prune_pickups(now_ms);
        broadcast();
        const auto &s = ctx_.state;
        if (s.phase == RoundPhase::Playing && s.round_end_time_ms && now_ms >= *s.round_end_time_ms) {
            end_round();
        }
    } catch (const std::exception &ex) {
        astro::metrics::runtime().tick_errors.fetch_add(1, std::memory_order_relaxed);
        astro::log::error("[sim] tick {} failed: {}", server_tick_, ex.what());
    } catch (...) {
        astro::metrics::runtime().tick_errors.fetch_add(1, std::memory_order_relaxed);
        astro::log::error("[sim] tick {} failed: unknown exception", server_tick_);
    }
    update_gauges();
}

astro::MapSync Simulation::current_map_sync() const
{
    astro::MapSync out;
    fill_map_sync(ctx_.state.map, &out);
    return out;
}

} // namespace astro::game
