// SPDX-License-Identifier: Apache-2.0
// Session registry: routing to players/displays, draining, stale session release.
#include "server/session/session_manager.hpp"

#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <algorithm>
#include <cassert>
#include <iostream>

static astro::ServerMessage left(const std::string &id)
{
    astro::ServerMessage m;
    m.mutable_player_left()->set_player_id(id);
    return m;
}

int main()
{
    auto scheduler = coro::io_scheduler::make_shared();
    astro::session::SessionManager mgr;

    // Create a dummy socket connection plus local sessions
    coro::net::tcp::client c1{scheduler};
    auto s1 = mgr.add_connection(std::move(c1));
    auto s2 = mgr.add_local();
    auto display = mgr.add_local();
    auto lurker = mgr.add_local(); // connected, not joined
    assert(s1->client);
    assert(!s2->client);
    assert(s1->connection_id != s2->connection_id);
    assert(mgr.snapshot_all_sessions().size() == 4);

    mgr.attach_player(s1, "p1");
    mgr.attach_player(s2, "p2");
    mgr.attach_display(display);
    mgr.attach_display(display);
    assert(mgr.display_count() == 1);

    mgr.push_to_player("p2", left("x"));
    mgr.push_to_player("nobody", left("x"));
    assert(s1->outgoing.empty());
    assert(s2->outgoing.size() == 1);

    mgr.push_to_displays(left("y"));
    assert(display->outgoing.size() == 1);
    assert(s1->outgoing.empty());

    mgr.push_to_joined(left("z"));
    assert(s1->outgoing.size() == 1);
    assert(s2->outgoing.size() == 2);
    assert(display->outgoing.size() == 2);
    assert(lurker->outgoing.empty());

    mgr.push_message(lurker, left("direct"));
    auto drained = mgr.drain_messages(lurker);
    assert(drained.size() == 1);
    assert(drained[0].player_left().player_id() == "direct");
    assert(lurker->outgoing.empty());

    // Stale heartbeat: the monitor releases the session and gets the player back.
    s1->last_heartbeat -= std::chrono::hours(1);
    auto released = mgr.disconnect_session(s1);
    assert(released && *released == "p1");
    assert(!mgr.disconnect_session(s1));
    assert(s1->closed);
    assert(s1->outgoing.empty());
    auto all = mgr.snapshot_all_sessions();
    assert(std::none_of(all.begin(), all.end(), [&](const auto &s) { return s == s1; }));
    mgr.push_to_player("p1", left("late"));
    mgr.push_message(s1, left("late"));
    assert(s1->outgoing.empty());

    mgr.update_heartbeat(s2);
    assert(std::chrono::steady_clock::now() - s2->last_heartbeat < std::chrono::seconds(5));

    assert(!mgr.disconnect_session(display));
    assert(mgr.display_count() == 0);
    assert(!mgr.disconnect_session(lurker));
    assert(mgr.snapshot_all_sessions().size() == 1);

    std::cout << "unit_session_manager OK" << std::endl;
    return 0;
}
