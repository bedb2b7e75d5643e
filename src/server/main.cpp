// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/game/map_model.hpp"
#include "server/game/simulation.hpp"
#include "server/game/tick_loop.hpp"
#include "server/net/dispatch.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/net/session_egress.hpp"
#include "server/session/session_manager.hpp"

#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

namespace astro {
std::atomic_bool g_shutdown{false};
}

static coro::task<void> heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> sched, astro::net::ServerServices svc, uint32_t timeout_sec)
{
    co_await sched->schedule();
    using clock = std::chrono::steady_clock;
    while (!astro::g_shutdown.load()) {
        auto now = clock::now();
        auto sessions = svc.sessions->snapshot_all_sessions();
        for (auto &s : sessions) {
            auto diff = std::chrono::duration_cast<std::chrono::seconds>(now - s->last_heartbeat).count();
            if (diff > timeout_sec) {
                astro::log::warn("[hb] disconnect timeout conn={} player={} diff={}s", s->connection_id, s->player_id, diff);
                astro::net::release_session(svc, s);
            }
        }
        co_await sched->yield_for(std::chrono::seconds(1));
    }
    co_return;
}

static void handle_signal(int)
{
    astro::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                astro::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                astro::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    astro::cfg::ServerConfig cfg;
    std::shared_ptr<astro::game::MapCatalog> maps;
    try {
        cfg = astro::cfg::load_config(config_path);
        if (cli_port_override) {
            cfg.listen_port = port_override;
        }
        // Apply logging config via environment before the first log init; explicit settings win.
        if (!cfg.log_level.empty() && std::getenv("ASTRO_LOG_LEVEL") == nullptr) {
            setenv("ASTRO_LOG_LEVEL", cfg.log_level.c_str(), 1);
        }
        if (cfg.log_json) {
            setenv("ASTRO_LOG_JSON", "1", 1);
        }
        astro::log::init();
        maps = std::make_shared<astro::game::MapCatalog>(astro::game::MapCatalog::load_directory(
            cfg.maps_dir, cfg.map_names, cfg.grid_width, cfg.grid_height, cfg.block_size));
    } catch (const std::exception &ex) {
        astro::log::error("Startup failed ({}): {}", config_path, ex.what());
        astro::log::shutdown();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    astro::log::info("astro arena server starting");
    astro::log::info("Tick rate: {} Hz, round duration: {} ms", cfg.tick_rate, cfg.round_duration_ms);
    astro::log::info("Listening on port: {}", cfg.listen_port);
    for (const auto &name : maps->names()) {
        astro::log::info("Map available: {}", name);
    }
    if (duration_override_sec > 0) {
        astro::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    }

    auto sessions = std::make_shared<astro::session::SessionManager>();
    astro::net::SessionEgress egress(sessions);
    auto sim = std::make_shared<astro::game::Simulation>(cfg.simulation(), maps, egress);
    astro::net::ServerServices svc{sessions, sim};

    // Simulation, listener and connections share one thread: input is applied between ticks without locks.
    auto scheduler = coro::io_scheduler::make_shared(coro::io_scheduler::options{
        .execution_strategy = coro::io_scheduler::execution_strategy_t::process_tasks_inline});
    scheduler->spawn(astro::game::run_tick_loop(scheduler, sim, cfg.tick_rate, astro::g_shutdown));
    scheduler->spawn(astro::net::run_listener(scheduler, svc, cfg.listen_port, cfg.tick_rate));
    scheduler->spawn(heartbeat_monitor(scheduler, svc, cfg.heartbeat_timeout_seconds));
    if (cfg.metrics_port != 0) {
        scheduler->spawn(astro::net::run_metrics_endpoint(scheduler, cfg.metrics_port));
    }

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!astro::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                astro::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                astro::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            auto &rt = astro::metrics::runtime();
            uint64_t samples = rt.tick_samples.load();
            uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load() / samples : 0;
            astro::log::info(
                "{\"metric\":\"runtime\",\"avg_tick_ns\":{},\"p99_tick_ns\":{},\"ticks_late\":{},\"players\":{}}",
                avg_ns,
                astro::metrics::approx_tick_p99(),
                rt.ticks_late.load(),
                rt.connected_players.load());
        }
    }
    astro::log::info("Shutdown requested");
    scheduler->shutdown();
    auto &snap = astro::metrics::snapshot();
    astro::log::info(
        "{\"metric\":\"snapshot_totals\",\"full_bytes\":{},\"full_count\":{},\"personal_bytes\":{},\"personal_count\":{}}",
        snap.full_bytes.load(),
        snap.full_count.load(),
        snap.personal_bytes.load(),
        snap.personal_count.load());
    astro::log::info("Shutdown complete.");
    astro::log::shutdown();
    return 0;
}
