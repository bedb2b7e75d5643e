// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>

namespace astro::net {

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &snap = astro::metrics::snapshot();
    auto &rt = astro::metrics::runtime();
    uint64_t samples = rt.tick_samples.load();
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load() / samples : 0;
    uint64_t wait_samples = rt.wait_samples.load();
    uint64_t wait_mean_ns = wait_samples ? rt.wait_duration_ns_accum.load() / wait_samples : 0;
    // Snapshot metrics
    oss << "# TYPE astro_snapshot_full_bytes counter\n";
    oss << "astro_snapshot_full_bytes " << snap.full_bytes.load() << "\n";
    oss << "# TYPE astro_snapshot_full_count counter\n";
    oss << "astro_snapshot_full_count " << snap.full_count.load() << "\n";
    oss << "# TYPE astro_personal_state_bytes counter\n";
    oss << "astro_personal_state_bytes " << snap.personal_bytes.load() << "\n";
    oss << "# TYPE astro_personal_state_count counter\n";
    oss << "astro_personal_state_count " << snap.personal_count.load() << "\n";
    oss << "# TYPE astro_map_sync_count counter\n";
    oss << "astro_map_sync_count " << snap.map_sync_count.load() << "\n";
    // Gauges
    oss << "# TYPE astro_connected_players gauge\n";
    oss << "astro_connected_players " << rt.connected_players.load() << "\n";
    oss << "# TYPE astro_display_sessions gauge\n";
    oss << "astro_display_sessions " << rt.display_sessions.load() << "\n";
    oss << "# TYPE astro_bullets_active gauge\n";
    oss << "astro_bullets_active " << rt.bullets_active.load() << "\n";
    oss << "# TYPE astro_power_ups_active gauge\n";
    oss << "astro_power_ups_active " << rt.power_ups_active.load() << "\n";
    oss << "# TYPE astro_mines_active gauge\n";
    oss << "astro_mines_active " << rt.mines_active.load() << "\n";
    oss << "# TYPE astro_avg_tick_ns gauge\n";
    oss << "astro_avg_tick_ns " << avg_ns << "\n";
    oss << "# TYPE astro_p99_tick_ns gauge\n";
    oss << "astro_p99_tick_ns " << astro::metrics::approx_tick_p99() << "\n";
    oss << "# TYPE astro_wait_mean_ns gauge\n";
    oss << "astro_wait_mean_ns " << wait_mean_ns << "\n";
    // Counters
    oss << "# TYPE astro_ticks_late counter\n";
    oss << "astro_ticks_late " << rt.ticks_late.load() << "\n";
    oss << "# TYPE astro_tick_errors counter\n";
    oss << "astro_tick_errors " << rt.tick_errors.load() << "\n";
    oss << "# TYPE astro_rounds_started counter\n";
    oss << "astro_rounds_started " << rt.rounds_started.load() << "\n";
    oss << "# TYPE astro_kills_total counter\n";
    oss << "astro_kills_total " << rt.kills_total.load() << "\n";
    oss << "# TYPE astro_inputs_rejected counter\n";
    oss << "astro_inputs_rejected " << rt.inputs_rejected.load() << "\n";
    // Tick duration histogram (nanoseconds). Buckets are geometric (x2) starting at 250k ns (0.25ms).
    oss << "# TYPE astro_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    constexpr uint64_t base = 250000;
    for (int i = 0; i < astro::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load();
        oss << "astro_tick_duration_ns_bucket{le=\"" << (base << i) << "\"} " << cumulative << "\n";
    }
    oss << "astro_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "astro_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << "\n";
    oss << "astro_tick_duration_ns_count " << samples << "\n";
    return oss.str();
}

std::string build_health_body()
{
    auto &rt = astro::metrics::runtime();
    std::ostringstream oss;
    oss << "{\"status\":\"ok\",\"players\":" << rt.connected_players.load()
        << ",\"displays\":" << rt.display_sessions.load() << ",\"ticks\":" << rt.tick_samples.load() << "}";
    return oss.str();
}

std::string build_http_response(std::string_view request)
{
    // naive method/path parse
    bool metrics = request.rfind("GET /metrics", 0) == 0;
    bool health = request.rfind("GET /health", 0) == 0;
    std::string body;
    std::string content_type = "text/plain; version=0.0.4";
    if (metrics) {
        body = build_metrics_body();
    } else if (health) {
        body = build_health_body();
        content_type = "application/json";
    } else {
        body = "not found\n";
    }
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics || health ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: " << content_type << "\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    return resp.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    // one-shot request
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event) {
        co_return;
    }
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok && rs != coro::net::recv_status::would_block)
        co_return;
    auto s = build_http_response(std::string_view(span.data(), span.size()));
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        astro::log::debug("[metrics] send failed, dropping response");
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    astro::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                scheduler->spawn(handle_client(scheduler, std::move(client)));
            }
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            astro::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace astro::net
