// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/simulation.hpp"
#include "server/session/session_manager.hpp"

#include <memory>

namespace astro::net {

// Routes simulation output into the per-session outbound queues flushed by the connection loops.
class SessionEgress final : public astro::game::Egress
{
public:
    explicit SessionEgress(std::shared_ptr<astro::session::SessionManager> sessions) : sessions_(std::move(sessions))
    {}

    void to_displays(const astro::ServerMessage &msg) override { sessions_->push_to_displays(msg); }
    void to_player(const std::string &player_id, const astro::ServerMessage &msg) override
    {
        sessions_->push_to_player(player_id, msg);
    }
    void to_all(const astro::ServerMessage &msg) override { sessions_->push_to_joined(msg); }

private:
    std::shared_ptr<astro::session::SessionManager> sessions_;
};

} // namespace astro::net
