// SPDX-License-Identifier: Apache-2.0
#include "common/framing.hpp"
#include "game.pb.h"
#include "server/game/content.hpp"
#include "server/game/map_layout.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/net/listener.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <iostream>
#include <memory>
#include <span>
#include <string>

using namespace std::chrono_literals;

static coro::task<bool> send_message(coro::net::tcp::client &cli, const arena::ClientMessage &msg)
{
    std::string payload;
    msg.SerializeToString(&payload);
    auto frame = arena::netutil::build_frame(payload);
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        co_await cli.poll(coro::poll_op::write);
        auto [s, r] = cli.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block)
            rest = r;
        else
            co_return false;
    }
    co_return true;
}

static coro::task<void> client_flow(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
{
    // Give the listener time to bind before connecting.
    co_await sched->yield_for(100ms);
    coro::net::tcp::client cli{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
    auto st = co_await cli.connect(2s);
    assert(st == coro::net::connect_status::connected);

    // Anything before join is refused.
    arena::ClientMessage early;
    early.mutable_queue_join()->set_mode("world");
    bool sent_early = co_await send_message(cli, early);
    assert(sent_early);

    arena::ClientMessage join;
    join.mutable_join()->set_name(" e2e\tplayer ");
    join.mutable_join()->set_class_name("warrior");
    bool sent_join = co_await send_message(cli, join);
    assert(sent_join);
    arena::ClientMessage queue;
    queue.mutable_queue_join()->set_mode("world");
    bool sent_queue = co_await send_message(cli, queue);
    assert(sent_queue);

    arena::netutil::FrameParseState fps;
    std::string player_id;
    bool got_need_join = false, got_joined = false, got_welcome = false, got_snapshot = false;
    bool sent_followups = false, got_pong = false, got_cast = false;
    auto deadline = std::chrono::steady_clock::now() + 8s;
    while (std::chrono::steady_clock::now() < deadline && !(got_snapshot && got_pong && got_cast)) {
        co_await cli.poll(coro::poll_op::read, 100ms);
        std::string chunk(4096, '\0');
        auto [rs, span] = cli.recv(chunk);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok)
            break;
        arena::netutil::feed(fps, std::string_view(span.data(), span.size()));
        std::string pl;
        while (arena::netutil::try_extract(fps, pl)) {
            arena::ServerMessage sm;
            assert(sm.ParseFromArray(pl.data(), static_cast<int>(pl.size())));
            if (sm.has_error() && sm.error().reason() == "need_join") {
                got_need_join = true;
            } else if (sm.has_joined()) {
                got_joined = true;
                player_id = sm.joined().player_id();
                assert(sm.joined().name() == "e2eplayer");
                std::cout << "[e2e] joined as " << player_id << std::endl;
            } else if (sm.has_welcome()) {
                got_welcome = true;
                assert(sm.welcome().player_id() == player_id);
                assert(sm.welcome().tick_rate() == 20);
                std::cout << "[e2e] welcome match=" << sm.welcome().match_id() << std::endl;
            } else if (sm.has_snapshot() && got_welcome) {
                bool present = false;
                for (const auto &p : sm.snapshot().players())
                    present = present || p.id() == player_id;
                got_snapshot = got_snapshot || present;
            } else if (sm.has_pong()) {
                got_pong = sm.pong().ts() == 4242;
            } else if (sm.has_cast_effect()) {
                got_cast = got_cast || sm.cast_effect().caster_id() == player_id;
            }
        }
        if (got_snapshot && !sent_followups) {
            sent_followups = true;
            arena::ClientMessage ping;
            ping.mutable_ping()->set_ts(4242);
            bool sent_ping = co_await send_message(cli, ping);
            assert(sent_ping);
            arena::ClientMessage cast;
            cast.mutable_cast()->set_slot(4);
            bool sent_cast = co_await send_message(cli, cast);
            assert(sent_cast);
        }
    }
    assert(got_need_join);
    assert(got_joined);
    assert(got_welcome);
    assert(got_snapshot);
    assert(got_pong);
    assert(got_cast);
    std::cout << "e2e_join_match OK" << std::endl;
    co_return;
}

int main()
{
    auto sched = coro::default_executor::io_executor();
    const uint16_t port = 41017;

    arena::net::ListenerOptions listener;
    listener.port = port;
    sched->spawn(arena::net::run_listener(sched, listener));

    arena::mm::MatchConfig cfg;
    cfg.poll_interval_ms = 50;
    cfg.fixed_seed = 3;
    cfg.content = std::make_shared<const arena::game::GameContent>(arena::game::default_content(cfg.sim.map_half));
    cfg.layout = arena::game::build_maze_layout(cfg.sim.map_half);
    sched->spawn(arena::mm::run_matchmaker(sched, cfg));

    coro::sync_wait(client_flow(sched, port));
    return 0;
}
