// SPDX-License-Identifier: Apache-2.0
// session_manager.hpp - Connected clients and their outbound message queues.
#pragma once

#include "arena.pb.h"

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace astro::session {

struct Session : public std::enable_shared_from_this<Session>
{
    std::string connection_id;
    std::string player_id; // set once the client joined as a controller
    bool is_display{false}; // observers receive full snapshots and map syncs
    bool closed{false};
    std::chrono::steady_clock::time_point last_heartbeat{};

    std::unique_ptr<coro::net::tcp::client> client; // nullptr for local sessions
    std::vector<astro::ServerMessage> outgoing; // pending outbound messages

    Session(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    explicit Session(std::string cid) : connection_id(std::move(cid)) {}
};

class SessionManager
{
public:
    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Session without a socket; messages queue up until drained by the owner.
    std::shared_ptr<Session> add_local();
    void attach_player(const std::shared_ptr<Session> &s, const std::string &player_id);
    void attach_display(const std::shared_ptr<Session> &s);

    void push_message(const std::shared_ptr<Session> &s, const astro::ServerMessage &msg);
    void push_to_player(const std::string &player_id, const astro::ServerMessage &msg);
    void push_to_displays(const astro::ServerMessage &msg);
    // Every joined session, controllers and displays alike.
    void push_to_joined(const astro::ServerMessage &msg);
    std::vector<astro::ServerMessage> drain_messages(const std::shared_ptr<Session> &s);

    void update_heartbeat(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    size_t display_count();
    // Removes the session; returns the player id it controlled, if any. Idempotent.
    std::optional<std::string> disconnect_session(const std::shared_ptr<Session> &s);

private:
    std::mutex m_mutex;
    uint64_t m_connection_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_connection;
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_player;
    std::vector<std::shared_ptr<Session>> m_displays;
};

} // namespace astro::session
