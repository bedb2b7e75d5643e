// SPDX-License-Identifier: Apache-2.0
// Mine placement, owner immunity, trigger radius, blast radius, shields and expiry.
#include "server/game/effects.hpp"
#include "sim_test_support.hpp"

#include <cassert>
#include <iostream>

using astro::test::make_player;

int main()
{
    astro::game::PhysicsEngine physics;
    astro::game::EffectManager effects(physics);

    // Placement requires a charge and drops the mine at the ship position.
    {
        astro::game::SimContext ctx;
        ctx.state.players = {make_player("owner", 400.f, 400.f)};
        assert(!effects.place_mine(ctx, "owner", 0));
        ctx.state.players[0].mines_available = 1;
        assert(effects.place_mine(ctx, "owner", 0));
        assert(ctx.state.players[0].mines_available == 0);
        assert(ctx.state.mines.size() == 1);
        assert(ctx.state.mines[0].player_id == "owner");
        assert(ctx.state.mines[0].position.x == 400.f);
        // Sitting on your own mine does nothing.
        effects.update(ctx, 10);
        assert(ctx.state.mines.size() == 1);
        assert(ctx.state.players[0].is_alive);
        // Expires after its lifetime.
        ctx.state.players.push_back(make_player("passerby", 900.f, 900.f));
        effects.update(ctx, 30000);
        assert(ctx.state.mines.empty());
        assert(ctx.state.players[0].score == 0);
        assert(ctx.state.players[1].is_alive);
        assert(ctx.state.kill_events.empty());
    }

    // Trigger by an enemy; the blast kills everyone but the owner within range.
    {
        astro::game::SimContext ctx;
        auto shielded = make_player("shielded", 460.f, 400.f);
        shielded.shield_hits = 1;
        shielded.active_effects.push_back({astro::game::PowerUpType::Shield, astro::game::kNoExpiry, 0});
        ctx.state.players = {
            make_player("owner", 420.f, 400.f),
            make_player("trigger", 440.f, 400.f),
            make_player("bystander", 400.f, 490.f),
            make_player("safe", 400.f, 520.f),
            shielded};
        ctx.state.mines.push_back(astro::game::Mine{"m1", "owner", {400.f, 400.f}, 0});
        effects.update(ctx, 10);
        assert(ctx.state.mines.empty());
        assert(ctx.state.find_player("owner")->is_alive);
        assert(!ctx.state.find_player("trigger")->is_alive);
        assert(!ctx.state.find_player("bystander")->is_alive);
        assert(ctx.state.find_player("safe")->is_alive);
        const auto *s = ctx.state.find_player("shielded");
        assert(s->is_alive);
        assert(s->shield_hits == 0);
        assert(ctx.state.find_player("owner")->score == 2);
        assert(ctx.state.kill_events.size() == 2);
        for (const auto &k : ctx.state.kill_events) {
            assert(k.killer_id == "owner");
            assert(k.cause == astro::game::KillCause::Mine);
        }
    }

    // An enemy just outside the trigger radius leaves the mine armed.
    {
        astro::game::SimContext ctx;
        ctx.state.players = {make_player("owner", 100.f, 100.f), make_player("enemy", 443.f, 400.f)};
        ctx.state.mines.push_back(astro::game::Mine{"m1", "owner", {400.f, 400.f}, 0});
        effects.update(ctx, 10);
        assert(ctx.state.mines.size() == 1);
        assert(ctx.state.find_player("enemy")->is_alive);
        ctx.state.players[1].position = {441.f, 400.f};
        effects.update(ctx, 20);
        assert(ctx.state.mines.empty());
        assert(!ctx.state.find_player("enemy")->is_alive);
    }

    std::cout << "unit_mines OK" << std::endl;
    return 0;
}
