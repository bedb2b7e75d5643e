// SPDX-License-Identifier: Apache-2.0
// input_handler.hpp - Validates player commands and applies them to the game state.
#pragma once

#include "arena.pb.h"
#include "server/game/effects.hpp"
#include "server/game/sim_context.hpp"

#include <cstdint>

namespace astro::game {

class InputHandler
{
public:
    explicit InputHandler(EffectManager &effects) : effects_(effects) {}

    // Returns true when the command changed state. Malformed or out-of-phase
    // commands are dropped without feedback to the sender.
    bool handle(SimContext &ctx, const astro::InputEvent &ev, uint64_t now_ms);

private:
    void set_thrust(Player &p, bool thrust, uint64_t now_ms) const;
    bool fire(SimContext &ctx, Player &p, uint64_t now_ms) const;

    EffectManager &effects_;
};

} // namespace astro::game
