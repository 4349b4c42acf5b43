// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide counters and gauges (relaxed atomics, no allocation). Read by the Prometheus endpoint and the
// periodic runtime log line.
#pragma once
#include <atomic>
#include <cstdint>

namespace arena::metrics {

struct RuntimeCounters
{
    // Tick duration histogram: power-of-two buckets starting at 250us, last bucket is overflow.
    static constexpr int TICK_BUCKETS = 10;
    static constexpr uint64_t TICK_BUCKET_BASE_NS = 250'000;
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    std::atomic<uint64_t> tick_faults{0};
    // Idle time between ticks (time spent in yield_for)
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};

    // Gauges
    std::atomic<uint64_t> queue_depth{0};
    std::atomic<uint64_t> active_matches{0};
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> players_in_matches{0};
    std::atomic<uint64_t> mobs_alive{0};
    std::atomic<uint64_t> projectiles_active{0};

    // Counters
    std::atomic<uint64_t> matches_created{0};
    std::atomic<uint64_t> matches_cancelled{0};
    std::atomic<uint64_t> matches_finished{0};
    std::atomic<uint64_t> casts_accepted{0};
    std::atomic<uint64_t> casts_rejected{0};
    std::atomic<uint64_t> chat_relayed{0};
    std::atomic<uint64_t> chat_blocked{0};
    std::atomic<uint64_t> mob_kills{0};
    std::atomic<uint64_t> player_deaths{0};
    std::atomic<uint64_t> heartbeat_evictions{0};
    std::atomic<uint64_t> malformed_messages{0};
    std::atomic<uint64_t> message_faults{0};
};

struct SnapshotCounters
{
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint64_t> count{0};
    std::atomic<uint64_t> event_messages{0};
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

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS - 1; ++i) {
        if (ns < (RuntimeCounters::TICK_BUCKET_BASE_NS << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the bucket holding the 99th percentile sample.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99) / 100;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BUCKET_BASE_NS << i;
    }
    return RuntimeCounters::TICK_BUCKET_BASE_NS << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline void add_snapshot(uint64_t bytes)
{
    snapshot().bytes.fetch_add(bytes, std::memory_order_relaxed);
    snapshot().count.fetch_add(1, std::memory_order_relaxed);
}

inline void inc(std::atomic<uint64_t> &counter, uint64_t by = 1)
{
    counter.fetch_add(by, std::memory_order_relaxed);
}

// Saturating decrement for gauges shared by several owners.
inline void dec(std::atomic<uint64_t> &gauge, uint64_t by = 1)
{
    uint64_t cur = gauge.load(std::memory_order_relaxed);
    while (true) {
        uint64_t next = cur > by ? cur - by : 0;
        if (gauge.compare_exchange_weak(cur, next, std::memory_order_relaxed))
            return;
    }
}

} // namespace arena::metrics
