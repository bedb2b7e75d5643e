// SPDX-License-Identifier: Apache-2.0
#include "server/session/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace astro::session {

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid, std::move(client));
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

std::shared_ptr<Session> SessionManager::add_local()
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "local_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid);
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

void SessionManager::attach_player(const std::shared_ptr<Session> &s, const std::string &player_id)
{
    std::scoped_lock lk{m_mutex};
    s->player_id = player_id;
    m_by_player[player_id] = s;
}

void SessionManager::attach_display(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->is_display) {
        return;
    }
    s->is_display = true;
    m_displays.push_back(s);
    astro::metrics::runtime().display_sessions.store(m_displays.size(), std::memory_order_relaxed);
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, const astro::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed) {
        return;
    }
    s->outgoing.push_back(msg);
}

void SessionManager::push_to_player(const std::string &player_id, const astro::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_player.find(player_id);
    if (it == m_by_player.end() || it->second->closed) {
        return;
    }
    it->second->outgoing.push_back(msg);
}

void SessionManager::push_to_displays(const astro::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    for (auto &s : m_displays) {
        s->outgoing.push_back(msg);
    }
}

void SessionManager::push_to_joined(const astro::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    for (auto &kv : m_by_player) {
        kv.second->outgoing.push_back(msg);
    }
    for (auto &s : m_displays) {
        if (s->player_id.empty()) {
            s->outgoing.push_back(msg);
        }
    }
}

std::vector<astro::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<astro::ServerMessage> out;
    out.swap(s->outgoing);
    return out;
}

void SessionManager::update_heartbeat(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_connection.size());
    for (auto &kv : m_by_connection)
        res.push_back(kv.second);
    return res;
}

size_t SessionManager::display_count()
{
    std::scoped_lock lk{m_mutex};
    return m_displays.size();
}

std::optional<std::string> SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed) {
        return std::nullopt;
    }
    s->closed = true;
    s->outgoing.clear();
    m_by_connection.erase(s->connection_id);
    if (s->is_display) {
        m_displays.erase(std::remove(m_displays.begin(), m_displays.end(), s), m_displays.end());
        astro::metrics::runtime().display_sessions.store(m_displays.size(), std::memory_order_relaxed);
    }
    if (s->player_id.empty()) {
        return std::nullopt;
    }
    m_by_player.erase(s->player_id);
    astro::log::debug("[session] {} released player {}", s->connection_id, s->player_id);
    return s->player_id;
}

} // namespace astro::session
