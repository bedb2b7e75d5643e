// SPDX-License-Identifier: Apache-2.0
// Round lifecycle: host-only start, timed end with a winner, reset, host handover and room capacity.
#include "common/metrics.hpp"
#include "server/game/simulation.hpp"
#include "sim_test_support.hpp"

#include <cassert>
#include <iostream>

using astro::ServerMessage;
using astro::game::RoundPhase;

// Egress whose display channel throws a non-standard exception.
struct ThrowingEgress final : public astro::game::Egress
{
    void to_displays(const ServerMessage &) override { throw 42; }
    void to_player(const std::string &, const ServerMessage &) override {}
    void to_all(const ServerMessage &) override {}
};

static const ServerMessage &last_of(const astro::test::RecordingEgress &eg, ServerMessage::PayloadCase c)
{
    for (auto it = eg.broadcast.rbegin(); it != eg.broadcast.rend(); ++it) {
        if (it->payload_case() == c)
            return *it;
    }
    assert(false && "message not found");
    return eg.broadcast.front();
}

int main()
{
    // Full lifecycle
    {
        astro::test::RecordingEgress eg;
        astro::game::Simulation sim(astro::test::test_config(), astro::test::open_catalog(), eg);
        assert(sim.state().phase == RoundPhase::Waiting);
        auto p1 = sim.join("alice", 1000);
        auto p2 = sim.join("", 1000);
        assert(p1 && p2);
        assert(*p1 != *p2);
        assert(sim.state().players.size() == 2);
        assert(sim.state().players[1].name == "Pilot 2");
        assert(sim.state().host_player_id == *p1);
        assert(eg.count_broadcast(ServerMessage::kPlayerJoined) == 2);
        assert(sim.state().players[0].color != sim.state().players[1].color);

        // Ticks in WAITING broadcast but do not simulate; inputs are dropped.
        assert(!sim.handle_input(astro::test::input(*p1, astro::FIRE), 1010));
        sim.tick(1016);
        assert(sim.state().phase == RoundPhase::Waiting);
        assert(eg.count_displays(ServerMessage::kSnapshot) == 1);

        // Only the host may start, only from WAITING.
        assert(!sim.start_round(*p2, 2000));
        assert(!sim.reset_round(*p1, 2000));
        eg.clear();
        assert(sim.start_round(*p1, 2000));
        assert(sim.state().phase == RoundPhase::Playing);
        assert(sim.state().is_round_active);
        assert(sim.state().round_end_time_ms == 2000 + 60000);
        assert(eg.count_displays(ServerMessage::kMapSync) == 1);
        assert(eg.count_broadcast(ServerMessage::kRoundStart) == 1);
        assert(last_of(eg, ServerMessage::kRoundStart).round_start().round_end_time_ms() == 62000);
        assert(!sim.start_round(*p1, 2100));
        for (const auto &p : sim.state().players) {
            assert(p.is_alive);
            assert(p.ammo == 3);
            assert(p.score == 0);
            assert(!sim.physics().is_obstructed(p.position, sim.context().tuning.ship_radius()));
        }

        // Round ends on the first tick at or past the deadline; highest score wins.
        sim.context().state.find_player(*p2)->score = 4;
        sim.context().state.find_player(*p1)->score = 1;
        sim.tick(61999);
        assert(sim.state().phase == RoundPhase::Playing);
        eg.clear();
        sim.tick(62000);
        assert(sim.state().phase == RoundPhase::Ended);
        assert(!sim.state().is_round_active);
        assert(!sim.state().round_end_time_ms);
        assert(eg.count_broadcast(ServerMessage::kRoundEnd) == 1);
        const auto &end = last_of(eg, ServerMessage::kRoundEnd).round_end();
        assert(end.has_winner());
        assert(end.winner().id() == *p2);
        assert(end.winner().score() == 4);
        assert(!sim.handle_input(astro::test::input(*p1, astro::THRUST_START), 62010));

        // Any connected player may reset; scores restart.
        assert(!sim.reset_round("nobody", 63000));
        assert(!sim.start_round(*p1, 63000));
        assert(sim.reset_round(*p2, 63000));
        assert(sim.state().phase == RoundPhase::Playing);
        for (const auto &p : sim.state().players) {
            assert(p.score == 0);
        }

        // Host handover to the earliest remaining player.
        auto p3 = sim.join("carol", 63100);
        assert(p3);
        assert(sim.leave(*p1));
        assert(sim.state().host_player_id == *p2);
        assert(!sim.leave(*p1));
        assert(eg.count_broadcast(ServerMessage::kPlayerLeft) == 1);

        // Empty room during PLAYING ends the round without a winner.
        eg.clear();
        assert(sim.leave(*p2));
        assert(sim.state().host_player_id == *p3);
        assert(sim.leave(*p3));
        assert(!sim.state().host_player_id);
        assert(sim.state().phase == RoundPhase::Ended);
        assert(!last_of(eg, ServerMessage::kRoundEnd).round_end().has_winner());
    }

    // Ties go to the earliest joined player.
    {
        astro::test::RecordingEgress eg;
        astro::game::Simulation sim(astro::test::test_config(), astro::test::open_catalog(), eg);
        auto a = sim.join("a", 0);
        auto b = sim.join("b", 0);
        assert(sim.start_round(*a, 0));
        sim.context().state.find_player(*a)->score = 2;
        sim.context().state.find_player(*b)->score = 2;
        sim.tick(60000);
        assert(last_of(eg, ServerMessage::kRoundEnd).round_end().winner().id() == *a);
    }

    // Capacity
    {
        astro::test::RecordingEgress eg;
        auto cfg = astro::test::test_config();
        cfg.max_players = 2;
        astro::game::Simulation sim(cfg, astro::test::open_catalog(), eg);
        assert(sim.join("a", 0));
        assert(sim.join("b", 0));
        assert(!sim.join("c", 0));
        assert(sim.state().players.size() == 2);
    }

    // A simulation without maps cannot be built.
    {
        astro::test::RecordingEgress eg;
        bool threw = false;
        try {
            astro::game::Simulation sim(
                astro::test::test_config(), std::make_shared<astro::game::MapCatalog>(), eg);
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
    }

    // A failing tick is counted and contained, whatever it throws.
    {
        ThrowingEgress eg;
        astro::game::Simulation sim(astro::test::test_config(), astro::test::open_catalog(), eg);
        auto before = astro::metrics::runtime().tick_errors.load();
        sim.tick(16);
        sim.tick(32);
        assert(astro::metrics::runtime().tick_errors.load() == before + 2);
        assert(sim.server_tick() == 2);
    }

    std::cout << "unit_round_phases OK" << std::endl;
    return 0;
}
