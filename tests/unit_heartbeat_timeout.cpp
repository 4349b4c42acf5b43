// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "server/net/heartbeat.hpp"
#include "test_sessions.hpp"

#include <coro/io_scheduler.hpp>

#include <cassert>
#include <chrono>
#include <iostream>

using namespace arena;
using PC = arena::ServerMessage::PayloadCase;

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    auto &mgr = mm::instance();
    auto quiet = test::make_joined_session(sched, "quiet");
    auto chatty = test::make_joined_session(sched, "chatty");
    auto anonymous = test::make_session(sched);

    // Pings go to joined sessions only and carry the given timestamp.
    assert(test::count_kind(mgr.drain_messages(quiet), PC::kPing) == 0);
    assert(net::send_pings(1234) >= 2);
    auto out = mgr.drain_messages(chatty);
    const auto *ping = test::last_of(out, PC::kPing);
    assert(ping && ping->ping().ts() == 1234);
    assert(mgr.drain_messages(anonymous).empty());

    // Rewind the quiet session past the timeout; the chatty one just spoke.
    quiet->last_heartbeat -= std::chrono::hours(1);
    mgr.update_heartbeat(chatty);
    const uint64_t evictions_before = metrics::runtime().heartbeat_evictions.load();
    const auto evicted = net::evict_stale_sessions(std::chrono::steady_clock::now(), std::chrono::seconds(15));
    assert(evicted == 1);
    assert(metrics::runtime().heartbeat_evictions.load() == evictions_before + 1);
    assert(!mgr.is_connected(quiet));
    assert(mgr.is_connected(chatty));
    for (auto &s : mgr.snapshot_all_sessions())
        assert(s != quiet);

    // Unjoined connections are never evicted by the monitor.
    anonymous->last_heartbeat -= std::chrono::hours(1);
    assert(net::evict_stale_sessions(std::chrono::steady_clock::now(), std::chrono::seconds(15)) == 0);
    assert(mgr.is_connected(anonymous));

    mgr.disconnect_session(chatty);
    mgr.disconnect_session(anonymous);
    std::cout << "unit_heartbeat_timeout OK" << std::endl;
    return 0;
}
