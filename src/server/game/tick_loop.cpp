// SPDX-License-Identifier: Apache-2.0
#include "server/game/tick_loop.hpp"

#include "common/clock.hpp"
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <chrono>

namespace astro::game {

coro::task<void> run_tick_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Simulation> sim,
    uint32_t tick_rate,
    const std::atomic_bool &shutdown)
{
    co_await scheduler->schedule();
    astro::log::info("[tick] loop start rate={} Hz", tick_rate);
    using clock = std::chrono::steady_clock;
    // Nanosecond interval avoids millisecond truncation (16.666ms at 60Hz).
    auto tick_interval = std::chrono::nanoseconds((1'000'000'000ull + tick_rate / 2) / tick_rate);
    auto next = clock::now();
    while (!shutdown.load()) {
        auto now = clock::now();
        if (now < next) {
            auto wait_dur = next - now;
            astro::metrics::add_wait_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
            co_await scheduler->yield_for(wait_dur);
            continue;
        }
        auto tick_start = now;
        sim->tick(astro::wall_clock_ms());
        auto tick_end = clock::now();
        auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tick_end - tick_start).count();
        astro::metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
        next += tick_interval;
        if (tick_end > next) {
            auto late_us = std::chrono::duration_cast<std::chrono::microseconds>(tick_end - next).count();
            astro::metrics::runtime().ticks_late.fetch_add(1, std::memory_order_relaxed);
            ASTRO_LOG_EVERY_N(warn, 60, "[tick] {} ran late by {} us", sim->server_tick(), late_us);
            // Run late rather than bursting to catch up.
            next = tick_end;
        }
    }
    astro::log::info("[tick] loop stopped at tick {}", sim->server_tick());
}

} // namespace astro::game
