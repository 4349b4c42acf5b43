// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "game.pb.h"
#include "server/game/events.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "server/net/message_handler.hpp"

#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <span>
#include <string>
#include <vector>

namespace arena::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<arena::mm::Session> session,
    ListenerOptions opts);

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, ListenerOptions opts)
{
    co_await scheduler->schedule();
    arena::log::info(
        "[listener] TCP listener on port {} origins={} auto_queue={}",
        opts.port,
        opts.allowed_origins.size(),
        opts.auto_queue_mode.empty() ? std::string("-") : opts.auto_queue_mode);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = opts.port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = arena::mm::instance().add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, session, opts));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            arena::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
}

// Returns false when the peer is gone; the caller drops the rest of the batch.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        auto pstat = co_await client.poll(coro::poll_op::write, std::chrono::milliseconds(1000));
        if (pstat != coro::poll_status::event)
            co_return false;
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static coro::task<bool> flush_outgoing(const std::shared_ptr<arena::mm::Session> &session)
{
    auto pending = arena::mm::instance().drain_messages(session);
    if (pending.empty() || !session->client)
        co_return true;
    std::string batch;
    batch.reserve(pending.size() * 64);
    for (auto &msg : pending) {
        std::string out;
        if (!msg.SerializeToString(&out)) {
            arena::log::warn("[conn] serialize failed player={}", session->player_id);
            continue;
        }
        arena::netutil::append_frame(batch, out);
    }
    co_return co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()));
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<arena::mm::Session> session,
    ListenerOptions opts)
{
    co_await scheduler->schedule();
    auto &mgr = arena::mm::instance();
    arena::log::info("[conn] new connection id={}", session->connection_id);
    arena::netutil::FrameParseState fps;
    fps.max_frame_bytes = opts.max_frame_bytes;
    const uint32_t rate = std::max<uint32_t>(1, opts.tick_rate);
    const auto read_timeout = std::chrono::milliseconds(std::max<uint32_t>(5, 1000 / rate / 2));
    bool closing = false;
    std::string tmp(4096, '\0');
    while (session->client && mgr.is_connected(session)) {
        if (!co_await flush_outgoing(session)) {
            arena::log::debug("[conn] send failed id={}", session->connection_id);
            break;
        }
        if (closing)
            break;
        auto pstat = co_await session->client->poll(coro::poll_op::read, read_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event) {
            arena::log::debug("[conn] poll closed id={}", session->connection_id);
            break;
        }
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            arena::log::info("[conn] closed by peer id={}", session->connection_id);
            break;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            arena::log::warn("[conn] recv error id={}", session->connection_id);
            break;
        }
        if (rstatus == coro::net::recv_status::ok)
            arena::netutil::feed(fps, std::string_view(span.data(), span.size()));
        std::string payload;
        while (!closing && arena::netutil::try_extract(fps, payload)) {
            arena::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                arena::metrics::inc(arena::metrics::runtime().malformed_messages);
                continue;
            }
            mgr.update_heartbeat(session);
            try {
                closing = handle_client_message(session, cmsg, opts) == Disposition::close;
            } catch (const std::exception &e) {
                arena::metrics::inc(arena::metrics::runtime().message_faults);
                arena::log::error("[conn] message fault id={} what={}", session->connection_id, e.what());
                mgr.push_message(session, arena::game::make_error("server_error", "Internal server error"));
            }
        }
        if (fps.invalid) {
            arena::metrics::inc(arena::metrics::runtime().malformed_messages);
            arena::log::warn("[conn] invalid frame header, dropping id={}", session->connection_id);
            break;
        }
    }
    mgr.disconnect_session(session);
    session->client.reset();
    arena::log::info("[conn] connection finished id={} player={}", session->connection_id, session->player_id);
}

} // namespace arena::net
