// SPDX-License-Identifier: Apache-2.0
// snapshot.hpp - Translation of the game state into wire messages.
#pragma once

#include "arena.pb.h"
#include "server/game/game_state.hpp"

#include <cstdint>

namespace astro::game {

astro::PowerUpKind to_wire(PowerUpType type);
astro::RoundPhase to_wire(RoundPhase phase);
astro::KillCause to_wire(KillCause cause);

// Full state for display clients (no map blocks).
void fill_snapshot(const GameState &state, uint64_t server_tick, astro::StateSnapshot *out);
// Controller view of one player together with the round metadata it needs.
void fill_personal_state(const GameState &state, const Player &p, astro::PersonalState *out);
void fill_map_sync(const MapModel &map, astro::MapSync *out);

} // namespace astro::game
