// SPDX-License-Identifier: Apache-2.0
// effects.hpp - Power-up spawn economy, timed/charge effects, mines and dash.
#pragma once

#include "server/game/physics.hpp"
#include "server/game/sim_context.hpp"

#include <cstdint>
#include <string_view>

namespace astro::game {

class EffectManager
{
public:
    explicit EffectManager(const PhysicsEngine &physics) : physics_(physics) {}

    // Spawning, expiry, pickups, effect sweep and mines for one tick.
    void update(SimContext &ctx, uint64_t now_ms);

    // Applies the pickup policy for the given type on behalf of picker.
    void apply_power_up(SimContext &ctx, Player &picker, PowerUpType type, uint64_t now_ms);
    // Spawns one ambient power-up of a random type; false when the cap is reached.
    bool spawn_power_up(SimContext &ctx, uint64_t now_ms);

    // Charge-gated commands; false when the player lacks the charge or is dead.
    bool place_mine(SimContext &ctx, std::string_view player_id, uint64_t now_ms);
    bool dash(SimContext &ctx, std::string_view player_id);

    // Drops power-ups and mines and restarts the spawn interval.
    void clear_round(SimContext &ctx, uint64_t now_ms);

    static uint32_t max_ammo(const Player &p, const GameTuning &t);
    static float reload_multiplier(const Player &p, const GameTuning &t);

private:
    void collect_power_ups(SimContext &ctx, uint64_t now_ms);
    void sweep_effects(SimContext &ctx, uint64_t now_ms) const;
    void update_mines(SimContext &ctx, uint64_t now_ms) const;
    void detonate(SimContext &ctx, const Mine &mine) const;
    b2Vec2 random_open_position(SimContext &ctx, float radius) const;

    const PhysicsEngine &physics_;
    uint64_t last_spawn_ms_{0};
};

} // namespace astro::game
