// SPDX-License-Identifier: Apache-2.0
#include "server/net/heartbeat.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/entities.hpp"
#include "server/game/events.hpp"
#include "server/matchmaking/session_manager.hpp"

namespace arena::net {

size_t send_pings(uint64_t ts)
{
    auto &mgr = arena::mm::instance();
    auto sessions = mgr.snapshot_all_sessions();
    const auto ping = arena::game::make_ping(ts);
    for (auto &s : sessions)
        mgr.push_message(s, ping);
    return sessions.size();
}

size_t evict_stale_sessions(std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout)
{
    auto &mgr = arena::mm::instance();
    auto stale = mgr.stale_sessions(now - timeout);
    for (auto &s : stale) {
        arena::log::warn("[hb] disconnect timeout player={} conn={}", s->player_id, s->connection_id);
        mgr.disconnect_session(s);
        arena::metrics::inc(arena::metrics::runtime().heartbeat_evictions);
    }
    return stale.size();
}

coro::task<void> run_heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint32_t interval_seconds,
    uint32_t timeout_seconds,
    const std::atomic_bool &shutdown)
{
    co_await scheduler->schedule();
    arena::log::info("[hb] monitor started interval={}s timeout={}s", interval_seconds, timeout_seconds);
    const auto timeout = std::chrono::milliseconds(uint64_t{timeout_seconds} * 1000);
    while (!shutdown.load()) {
        evict_stale_sessions(std::chrono::steady_clock::now(), timeout);
        send_pings(static_cast<uint64_t>(arena::game::steady_now_ms()));
        co_await scheduler->yield_for(std::chrono::seconds(interval_seconds == 0 ? 1 : interval_seconds));
    }
}

} // namespace arena::net
