// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <cstdint>

// Per-callsite rate-limited logging: emits on the 1st, (N+1)th, (2N+1)th ... invocation.
// Usage: ASTRO_LOG_EVERY_N(warn, 60, "tick {} overran budget by {} us", tick, over);
// The tick loop runs at 60 Hz, so anything logged per tick must go through this macro.
#define ASTRO_LOG_CONCAT_INNER(a, b) a##b
#define ASTRO_LOG_CONCAT(a, b) ASTRO_LOG_CONCAT_INNER(a, b)
#define ASTRO_LOG_EVERY_N(level, N, ...) \
    do { \
        static uint64_t ASTRO_LOG_CONCAT(astro_log_counter_, __LINE__) = 0; \
        if ((ASTRO_LOG_CONCAT(astro_log_counter_, __LINE__)++ % (N)) == 0) { \
            astro::log::level(__VA_ARGS__); \
        } \
    } while (0)
