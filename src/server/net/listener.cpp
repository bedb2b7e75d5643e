// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "arena.pb.h"
#include "common/clock.hpp"
#include "common/framing.hpp"
#include "common/logger.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <span>
#include <string>
#include <vector>

namespace astro::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    ServerServices svc,
    std::shared_ptr<astro::session::Session> session,
    std::chrono::milliseconds poll_timeout);

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, ServerServices svc, uint16_t port, uint32_t tick_rate)
{
    co_await scheduler->schedule();
    astro::log::info("[listener] TCP listener on port {}", port);
    auto poll_timeout = std::chrono::milliseconds(std::max<uint32_t>(1, 1000 / std::max<uint32_t>(1, tick_rate)));
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = svc.sessions->add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, svc, session, poll_timeout));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            astro::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
}

// Returns false when the peer can no longer be written to.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    ServerServices svc,
    std::shared_ptr<astro::session::Session> session,
    std::chrono::milliseconds poll_timeout)
{
    co_await scheduler->schedule();
    astro::log::info("[conn] {} connected", session->connection_id);
    astro::netutil::FrameParseState fps;
    std::string reason = "closed";
    while (!session->closed) {
        auto pending = svc.sessions->drain_messages(session);
        if (!pending.empty()) {
            std::string batch;
            batch.reserve(pending.size() * 64);
            for (auto &msg : pending) {
                std::string out;
                if (!msg.SerializeToString(&out)) {
                    astro::log::warn("[conn] {} failed to serialize outbound message", session->connection_id);
                    continue;
                }
                astro::netutil::append_frame(batch, out);
            }
            if (!co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()))) {
                reason = "send error";
                break;
            }
        }
        auto pstat = co_await session->client->poll(coro::poll_op::read, poll_timeout);
        if (pstat == coro::poll_status::timeout) {
            continue;
        }
        if (pstat != coro::poll_status::event) {
            reason = "poll error";
            break;
        }
        std::string tmp(4096, '\0');
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            reason = "closed by peer";
            break;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            reason = "recv error";
            break;
        }
        if (rstatus == coro::net::recv_status::ok) {
            fps.feed(std::span<const char>(span.data(), span.size()));
        }
        std::string payload;
        bool keep_open = true;
        while (keep_open) {
            auto res = astro::netutil::try_extract(fps, payload);
            if (res == astro::netutil::ExtractResult::need_more) {
                break;
            }
            if (res == astro::netutil::ExtractResult::invalid) {
                reason = "invalid frame";
                keep_open = false;
                break;
            }
            astro::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                reason = "malformed protobuf";
                keep_open = false;
                break;
            }
            keep_open = handle_client_message(svc, session, cmsg, astro::wall_clock_ms());
            if (!keep_open) {
                reason = "leave";
            }
        }
        if (!keep_open) {
            // Flush replies queued by the final message before closing.
            auto last = svc.sessions->drain_messages(session);
            std::string batch;
            for (auto &msg : last) {
                std::string out;
                if (msg.SerializeToString(&out)) {
                    astro::netutil::append_frame(batch, out);
                }
            }
            if (!batch.empty()) {
                (void)co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()));
            }
            break;
        }
    }
    release_session(svc, session);
    astro::log::info("[conn] {} disconnected ({})", session->connection_id, reason);
}

} // namespace astro::net
