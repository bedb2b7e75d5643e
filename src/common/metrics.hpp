// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide counters (atomics, no dynamic allocation) exported by the /metrics endpoint.
#pragma once
#include <atomic>
#include <cstdint>

namespace astro::metrics {

struct SnapshotCounters
{
    std::atomic<uint64_t> full_bytes{0};
    std::atomic<uint64_t> full_count{0};
    std::atomic<uint64_t> personal_bytes{0};
    std::atomic<uint64_t> personal_count{0};
    std::atomic<uint64_t> map_sync_count{0};
};

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    std::atomic<uint64_t> ticks_late{0};
    // Power-of-two buckets for tick durations (base 250k ns) -> up to ~128ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{}; // bucket 0:<250k,1:<500k,...
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};
    // Gauges refreshed once per tick
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> display_sessions{0};
    std::atomic<uint64_t> bullets_active{0};
    std::atomic<uint64_t> power_ups_active{0};
    std::atomic<uint64_t> mines_active{0};
    // Counters
    std::atomic<uint64_t> rounds_started{0};
    std::atomic<uint64_t> kills_total{0};
    std::atomic<uint64_t> inputs_rejected{0};
    std::atomic<uint64_t> tick_errors{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline SnapshotCounters &snapshot()
{
    static SnapshotCounters inst;
    return inst;
}

// --- Tick duration histogram ---
inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 250000; // 0.25ms
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (base << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    constexpr uint64_t base = 250000;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return base << i;
    }
    return base << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline void add_full(uint64_t bytes)
{
    snapshot().full_bytes.fetch_add(bytes, std::memory_order_relaxed);
    snapshot().full_count.fetch_add(1, std::memory_order_relaxed);
}

inline void add_personal(uint64_t bytes)
{
    snapshot().personal_bytes.fetch_add(bytes, std::memory_order_relaxed);
    snapshot().personal_count.fetch_add(1, std::memory_order_relaxed);
}

} // namespace astro::metrics
