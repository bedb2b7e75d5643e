// SPDX-License-Identifier: Apache-2.0
// Ship-ship contact: separation, equal-mass momentum exchange, ghost and dead exemptions.
#include "server/game/physics.hpp"
#include "sim_test_support.hpp"

#include <cassert>
#include <iostream>

using astro::test::make_player;
using astro::test::near;

static float distance(const astro::game::Player &a, const astro::game::Player &b)
{
    return b2Distance(a.position, b.position);
}

int main()
{
    astro::game::PhysicsEngine physics;
    const float min_dist = astro::game::GameTuning{}.collision_distance();
    assert(near(min_dist, 60.f));

    // Approaching pair: impulse along the normal, total momentum preserved.
    {
        astro::game::SimContext ctx;
        auto a = make_player("a", 500.f, 500.f);
        auto b = make_player("b", 540.f, 500.f);
        a.velocity = {2.f, 0.f};
        b.velocity = {-1.f, 0.f};
        ctx.state.players = {a, b};
        float momentum_before = (2.f - 1.f) * ctx.tuning.friction;
        physics.update(ctx, 0);
        const auto &pa = ctx.state.players[0];
        const auto &pb = ctx.state.players[1];
        assert(distance(pa, pb) >= min_dist - 1e-3f);
        assert(near(pa.velocity.x + pb.velocity.x, momentum_before));
        assert(near(pa.velocity.y + pb.velocity.y, 0.f));
        assert(pa.velocity.x < 0.f && pb.velocity.x > 0.f);
        assert(near(pa.velocity.x, 1.96f - 2.352f));
        assert(near(pb.velocity.x, -0.98f + 2.352f));
    }

    // Overlapping but already separating: no impulse, positions still pushed apart.
    {
        astro::game::SimContext ctx;
        auto a = make_player("a", 500.f, 500.f);
        auto b = make_player("b", 530.f, 500.f);
        a.velocity = {-1.f, 0.f};
        b.velocity = {1.f, 0.f};
        ctx.state.players = {a, b};
        physics.update(ctx, 0);
        assert(near(ctx.state.players[0].velocity.x, -0.98f));
        assert(near(ctx.state.players[1].velocity.x, 0.98f));
        assert(distance(ctx.state.players[0], ctx.state.players[1]) >= min_dist - 1e-3f);
    }

    // Ghost mode on either ship skips the pair.
    {
        astro::game::SimContext ctx;
        auto a = make_player("a", 500.f, 500.f);
        auto b = make_player("b", 540.f, 500.f);
        b.active_effects.push_back({astro::game::PowerUpType::GhostMode, 100000, 0});
        ctx.state.players = {a, b};
        physics.update(ctx, 0);
        assert(distance(ctx.state.players[0], ctx.state.players[1]) < min_dist);
    }

    // Dead ships neither move nor collide.
    {
        astro::game::SimContext ctx;
        auto a = make_player("a", 500.f, 500.f);
        auto b = make_player("b", 540.f, 500.f);
        b.is_alive = false;
        b.velocity = {3.f, 0.f};
        ctx.state.players = {a, b};
        physics.update(ctx, 0);
        assert(ctx.state.players[1].position.x == 540.f);
        assert(ctx.state.players[0].position.x == 500.f);
    }

    std::cout << "unit_physics_ships OK" << std::endl;
    return 0;
}
