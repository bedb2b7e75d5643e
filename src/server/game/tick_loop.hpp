// SPDX-License-Identifier: Apache-2.0
// tick_loop.hpp - Fixed-rate driver of the simulation on the io scheduler.
#pragma once

#include "server/game/simulation.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace astro::game {

// Ticks never overlap; an overrunning tick delays the next one instead of being skipped.
coro::task<void> run_tick_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Simulation> sim,
    uint32_t tick_rate,
    const std::atomic_bool &shutdown);

} // namespace astro::game
