// SPDX-License-Identifier: Apache-2.0
// Over TCP: a controller joins and starts a round, a display observes map sync and snapshots.
#include "arena.pb.h"
#include "common/framing.hpp"
#include "server/game/simulation.hpp"
#include "server/game/tick_loop.hpp"
#include "server/net/listener.hpp"
#include "server/net/session_egress.hpp"
#include "server/session/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <atomic>
#include <cassert>
#include <iostream>

using namespace std::chrono_literals;

static coro::task<bool> send_msg(coro::net::tcp::client &cli, const astro::ClientMessage &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
        co_return false;
    auto frame = astro::netutil::build_frame(payload);
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        co_await cli.poll(coro::poll_op::write);
        auto [s, r] = cli.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block)
            rest = r;
        else
            co_return false;
    }
    co_return true;
}

// Reads whatever is available within the timeout and appends decoded messages to out.
static coro::task<void> read_some(
    coro::net::tcp::client &cli,
    astro::netutil::FrameParseState &fps,
    std::vector<astro::ServerMessage> &out,
    std::chrono::milliseconds timeout)
{
    auto ps = co_await cli.poll(coro::poll_op::read, timeout);
    if (ps != coro::poll_status::event)
        co_return;
    std::string chunk(8192, '\0');
    auto [rs, span] = cli.recv(chunk);
    if (rs != coro::net::recv_status::ok)
        co_return;
    fps.feed(std::span<const char>(span.data(), span.size()));
    std::string pl;
    while (astro::netutil::try_extract(fps, pl) == astro::netutil::ExtractResult::complete) {
        astro::ServerMessage sm;
        bool parsed = sm.ParseFromArray(pl.data(), static_cast<int>(pl.size()));
        assert(parsed);
        out.push_back(std::move(sm));
    }
}

static coro::task<void> client_flow(std::shared_ptr<coro::io_scheduler> sched, uint16_t port, std::atomic_bool &done)
{
    // Give the listener a moment to bind.
    co_await sched->yield_for(100ms);
    coro::net::tcp::client ctl{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
    coro::net::tcp::client disp{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
    auto cst = co_await ctl.connect(2s);
    assert(cst == coro::net::connect_status::connected);
    cst = co_await disp.connect(2s);
    assert(cst == coro::net::connect_status::connected);

    astro::ClientMessage dj;
    dj.mutable_join()->set_display(true);
    bool sent = co_await send_msg(disp, dj);
    assert(sent);
    astro::ClientMessage pj;
    pj.mutable_join()->set_name("e2e");
    sent = co_await send_msg(ctl, pj);
    assert(sent);

    astro::netutil::FrameParseState ctl_fps;
    astro::netutil::FrameParseState disp_fps;
    std::vector<astro::ServerMessage> ctl_msgs;
    std::vector<astro::ServerMessage> disp_msgs;
    std::string player_id;
    bool start_sent = false;
    bool got_round_start = false;
    bool got_playing_personal = false;
    bool disp_got_map = false;
    bool disp_got_playing_snapshot = false;
    auto deadline = std::chrono::steady_clock::now() + 8s;
    while (std::chrono::steady_clock::now() < deadline
           && !(got_round_start && got_playing_personal && disp_got_map && disp_got_playing_snapshot)) {
        co_await read_some(ctl, ctl_fps, ctl_msgs, 50ms);
        co_await read_some(disp, disp_fps, disp_msgs, 50ms);
        for (const auto &m : ctl_msgs) {
            if (m.has_join_response()) {
                assert(m.join_response().success());
                player_id = m.join_response().player_id();
                std::cout << "[e2e] joined as " << player_id << std::endl;
            } else if (m.has_round_start()) {
                got_round_start = true;
                std::cout << "[e2e] got RoundStart map=" << m.round_start().map_name() << std::endl;
            } else if (m.has_personal() && m.personal().phase() == astro::PHASE_PLAYING) {
                got_playing_personal = true;
                assert(m.personal().id() == player_id);
                assert(m.personal().ammo() == 3);
            }
            assert(!m.has_snapshot()); // controllers never receive full snapshots
        }
        ctl_msgs.clear();
        for (const auto &m : disp_msgs) {
            if (m.has_map_sync()) {
                disp_got_map = true;
                assert(m.map_sync().grid_width() == 48);
            } else if (m.has_snapshot() && m.snapshot().phase() == astro::PHASE_PLAYING) {
                disp_got_playing_snapshot = true;
                assert(m.snapshot().players_size() == 1);
                std::cout << "[e2e] display snapshot tick=" << m.snapshot().server_tick() << std::endl;
            }
            assert(!m.has_personal());
        }
        disp_msgs.clear();
        if (!player_id.empty() && !start_sent) {
            astro::ClientMessage start;
            start.mutable_start_round();
            sent = co_await send_msg(ctl, start);
            assert(sent);
            start_sent = true;
        }
    }
    assert(got_round_start);
    assert(got_playing_personal);
    assert(disp_got_map);
    assert(disp_got_playing_snapshot);
    done.store(true);
    std::cout << "e2e_join_start OK" << std::endl;
    co_return;
}

int main()
{
    auto sched = coro::io_scheduler::make_shared(coro::io_scheduler::options{
        .execution_strategy = coro::io_scheduler::execution_strategy_t::process_tasks_inline});
    uint16_t port = 41031;
    auto sessions = std::make_shared<astro::session::SessionManager>();
    astro::net::SessionEgress egress(sessions);
    auto catalog = std::make_shared<astro::game::MapCatalog>();
    catalog->add(astro::game::MapModel{});
    astro::game::SimulationConfig cfg;
    cfg.fixed_seed = 5;
    auto sim = std::make_shared<astro::game::Simulation>(cfg, catalog, egress);
    astro::net::ServerServices svc{sessions, sim};
    std::atomic_bool done{false};
    sched->spawn(astro::game::run_tick_loop(sched, sim, 60, done));
    sched->spawn(astro::net::run_listener(sched, svc, port, 60));
    coro::sync_wait(client_flow(sched, port, done));
    return 0;
}
