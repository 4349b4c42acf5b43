// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <atomic>
#include <chrono>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

namespace arena::net {

namespace {

void emit(std::ostringstream &oss, std::string_view name, std::string_view type, uint64_t value)
{
    oss << "# TYPE arena_" << name << ' ' << type << "\n";
    oss << "arena_" << name << ' ' << value << "\n";
}

void gauge(std::ostringstream &oss, std::string_view name, const std::atomic<uint64_t> &v)
{
    emit(oss, name, "gauge", v.load(std::memory_order_relaxed));
}

void counter(std::ostringstream &oss, std::string_view name, const std::atomic<uint64_t> &v)
{
    emit(oss, name, "counter", v.load(std::memory_order_relaxed));
}

} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &snap = arena::metrics::snapshot();
    auto &rt = arena::metrics::runtime();
    const uint64_t samples = rt.tick_samples.load();
    const uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load() / samples : 0;
    const uint64_t waits = rt.wait_samples.load();
    const uint64_t avg_wait_ns = waits ? rt.wait_duration_ns_accum.load() / waits : 0;

    counter(oss, "snapshot_bytes", snap.bytes);
    counter(oss, "snapshot_count", snap.count);
    counter(oss, "event_messages", snap.event_messages);

    gauge(oss, "queue_depth", rt.queue_depth);
    gauge(oss, "active_matches", rt.active_matches);
    gauge(oss, "connected_players", rt.connected_players);
    gauge(oss, "players_in_matches", rt.players_in_matches);
    gauge(oss, "mobs_alive", rt.mobs_alive);
    gauge(oss, "projectiles_active", rt.projectiles_active);
    emit(oss, "avg_tick_ns", "gauge", avg_ns);
    emit(oss, "p99_tick_ns", "gauge", arena::metrics::approx_tick_p99());
    emit(oss, "avg_wait_ns", "gauge", avg_wait_ns);

    counter(oss, "matches_created", rt.matches_created);
    counter(oss, "matches_cancelled", rt.matches_cancelled);
    counter(oss, "matches_finished", rt.matches_finished);
    counter(oss, "casts_accepted", rt.casts_accepted);
    counter(oss, "casts_rejected", rt.casts_rejected);
    counter(oss, "chat_relayed", rt.chat_relayed);
    counter(oss, "chat_blocked", rt.chat_blocked);
    counter(oss, "mob_kills", rt.mob_kills);
    counter(oss, "player_deaths", rt.player_deaths);
    counter(oss, "heartbeat_evictions", rt.heartbeat_evictions);
    counter(oss, "malformed_messages", rt.malformed_messages);
    counter(oss, "message_faults", rt.message_faults);
    counter(oss, "tick_faults", rt.tick_faults);

    // Tick duration histogram; the last internal bucket is the overflow and only shows up in +Inf.
    oss << "# TYPE arena_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    for (int i = 0; i < arena::metrics::RuntimeCounters::TICK_BUCKETS - 1; ++i) {
        cumulative += rt.tick_hist[i].load();
        const uint64_t le = arena::metrics::RuntimeCounters::TICK_BUCKET_BASE_NS << i;
        oss << "arena_tick_duration_ns_bucket{le=\"" << le << "\"} " << cumulative << "\n";
    }
    cumulative += rt.tick_hist[arena::metrics::RuntimeCounters::TICK_BUCKETS - 1].load();
    oss << "arena_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "arena_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << "\n";
    oss << "arena_tick_duration_ns_count " << samples << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    // One-shot request
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event)
        co_return;
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok)
        co_return;
    std::string_view req(span.data(), span.size());
    const bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        auto ws = co_await client.poll(coro::poll_op::write, std::chrono::milliseconds(1000));
        if (ws != coro::poll_status::event)
            break;
        auto [st, rest] = client.send(out);
        if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block)
            break;
        out = rest;
    }
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    arena::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(handle_client(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            arena::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace arena::net
