// SPDX-License-Identifier: Apache-2.0
// heartbeat.hpp - liveness probing: periodic server pings and eviction of silent sessions.
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace arena::net {

// Queues ping {ts} for every joined session. Returns the number of sessions pinged.
size_t send_pings(uint64_t ts);

// Disconnects joined sessions silent for longer than timeout. Returns the number evicted.
size_t evict_stale_sessions(std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout);

coro::task<void> run_heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint32_t interval_seconds,
    uint32_t timeout_seconds,
    const std::atomic_bool &shutdown);

} // namespace arena::net
