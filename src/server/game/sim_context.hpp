// SPDX-License-Identifier: Apache-2.0
// sim_context.hpp - Everything one simulation step reads or mutates, passed explicitly to each component.
#pragma once

#include "server/game/game_state.hpp"
#include "server/game/timer_queue.hpp"
#include "server/game/tuning.hpp"

#include <random>
#include <string>
#include <unordered_map>

namespace astro::game {

struct SimContext
{
    GameTuning tuning;
    GameState state;
    std::mt19937 rng;
    TimerQueue timers;
    // Pending respawn timers keyed by player id (cancelled on leave and round reset).
    std::unordered_map<std::string, TimerQueue::Token> respawn_tokens;
};

} // namespace astro::game
