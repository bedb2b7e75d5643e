// SPDX-License-Identifier: Apache-2.0
// Wall bounce, spatial index queries, bullet removal and rotation range.
#include "server/game/physics.hpp"
#include "sim_test_support.hpp"

#include <cassert>
#include <iostream>

using astro::test::near;

static astro::game::MapModel single_block_map()
{
    astro::game::MapModel map;
    map.name = "one_block";
    map.blocks.push_back({5, 5}); // x,y in [200, 240]
    return map;
}

int main()
{
    astro::game::PhysicsEngine physics;
    astro::game::SimContext ctx;
    ctx.state.map = single_block_map();
    physics.rebuild_spatial_index(ctx.state.map);
    assert(physics.indexed_blocks() == 1);

    // Pure obstruction query
    assert(physics.is_obstructed({220.f, 220.f}, 1.f));
    assert(physics.is_obstructed({190.f, 220.f}, 11.f));
    assert(!physics.is_obstructed({190.f, 220.f}, 9.f));
    assert(!physics.is_obstructed({100.f, 100.f}, 10.f));

    // Ship whose tentative position touches the block keeps its position and bounces.
    auto bouncer = astro::test::make_player("a", 168.f, 220.f);
    bouncer.velocity = {5.f, 0.f};
    auto free_ship = astro::test::make_player("b", 600.f, 600.f);
    free_ship.velocity = {2.f, 1.f};
    ctx.state.players = {bouncer, free_ship};
    physics.update(ctx, 0);
    const auto &a = ctx.state.players[0];
    assert(a.position.x == 168.f && a.position.y == 220.f);
    assert(near(a.velocity.x, -5.f * 0.98f * 0.7f));
    assert(near(a.velocity.y, 0.f));
    // Ship without contact always moves.
    const auto &b = ctx.state.players[1];
    assert(near(b.position.x, 600.f + 2.f * 0.98f));
    assert(near(b.position.y, 600.f + 1.f * 0.98f));

    // Rotation stays within [0, 2pi) across many ticks of ramped turning.
    for (uint64_t t = 0; t < 5000; t += 16) {
        physics.update(ctx, t);
        for (const auto &p : ctx.state.players) {
            assert(p.rotation >= 0.f && p.rotation < astro::game::kTwoPi);
        }
    }

    // Bullets: wall overlap, leaving the field and lifetime expiry all delete.
    astro::game::SimContext bctx;
    bctx.state.map = single_block_map();
    auto wall_bullet = astro::game::Bullet{"b1", "x", {190.f, 220.f}, {8.f, 0.f}, 0, false};
    auto edge_bullet = astro::game::Bullet{"b2", "x", {1915.f, 500.f}, {8.f, 0.f}, 0, false};
    auto old_bullet = astro::game::Bullet{"b3", "x", {800.f, 800.f}, {1.f, 0.f}, 0, false};
    auto live_bullet = astro::game::Bullet{"b4", "x", {800.f, 900.f}, {1.f, 0.f}, 2500, false};
    bctx.state.bullets = {wall_bullet, edge_bullet, old_bullet, live_bullet};
    physics.update(bctx, 3000);
    assert(bctx.state.bullets.size() == 1);
    assert(bctx.state.bullets[0].id == "b4");
    assert(near(bctx.state.bullets[0].position.x, 801.f));

    // Rebuilding with an empty map clears the index.
    physics.rebuild_spatial_index(astro::game::MapModel{});
    assert(physics.indexed_blocks() == 0);
    assert(!physics.is_obstructed({220.f, 220.f}, 5.f));

    std::cout << "unit_physics_walls OK" << std::endl;
    return 0;
}
