// SPDX-License-Identifier: Apache-2.0
// dispatch.hpp - Applies decoded client messages to the simulation on behalf of a session.
#pragma once

#include "arena.pb.h"
#include "server/game/simulation.hpp"
#include "server/session/session_manager.hpp"

#include <cstdint>
#include <memory>

namespace astro::net {

struct ServerServices
{
    std::shared_ptr<astro::session::SessionManager> sessions;
    std::shared_ptr<astro::game::Simulation> sim;
};

// Longest player name kept; longer names are truncated.
inline constexpr size_t kMaxNameLength = 24;

// Returns false when the connection should be closed afterwards.
bool handle_client_message(
    ServerServices &svc,
    const std::shared_ptr<astro::session::Session> &session,
    const astro::ClientMessage &msg,
    uint64_t now_ms);

// Detaches the session and removes its player from the simulation. Safe to call more than once.
void release_session(ServerServices &svc, const std::shared_ptr<astro::session::Session> &session);

} // namespace astro::net
