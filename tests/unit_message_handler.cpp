// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "server/game/match.hpp"
#include "server/net/message_handler.hpp"
#include "test_sessions.hpp"
#include "test_world.hpp"

#include <coro/io_scheduler.hpp>

#include <cassert>
#include <iostream>
#include <string>
#include <variant>

using namespace arena;
using PC = arena::ServerMessage::PayloadCase;

namespace {

arena::ClientMessage join_msg(const std::string &name, const std::string &cls, const std::string &origin = {})
{
    arena::ClientMessage m;
    m.mutable_join()->set_name(name);
    m.mutable_join()->set_class_name(cls);
    m.mutable_join()->set_origin(origin);
    return m;
}

arena::ClientMessage queue_msg(const std::string &mode)
{
    arena::ClientMessage m;
    m.mutable_queue_join()->set_mode(mode);
    return m;
}

std::string error_reason(const std::vector<arena::ServerMessage> &out)
{
    const auto *e = test::last_of(out, PC::kError);
    return e ? e->error().reason() : std::string();
}

} // namespace

int main()
{
    // Name sanitisation.
    assert(net::sanitize_player_name("  Alice  ") == "Alice");
    assert(net::sanitize_player_name("Bo\x01\x7F" "b\n") == "Bob");
    assert(net::sanitize_player_name("   ").empty());
    assert(net::sanitize_player_name(std::string(40, 'z')).size() == net::kMaxNameChars);
    std::string accented(net::kMaxNameChars - 1, 'a');
    accented += "\xC3\xA9";
    assert(net::sanitize_player_name(accented).size() == net::kMaxNameChars - 1);

    // Origin allow-list.
    const std::vector<std::string> allowed{"https://play.example"};
    assert(net::origin_allowed({}, "https://anything"));
    assert(net::origin_allowed(allowed, "https://play.example"));
    assert(net::origin_allowed(allowed, ""));
    assert(!net::origin_allowed(allowed, "https://evil.example"));

    auto sched = coro::io_scheduler::make_shared();
    auto &mgr = mm::instance();
    net::ListenerOptions opts;
    opts.allowed_origins = allowed;

    // Everything except join requires a join first.
    auto s = test::make_session(sched);
    assert(net::handle_client_message(s, queue_msg("ffa"), opts) == net::Disposition::keep);
    assert(error_reason(mgr.drain_messages(s)) == "need_join");

    // A foreign origin is refused and the connection is closed.
    assert(net::handle_client_message(s, join_msg("mallory", "mage", "https://evil.example"), opts)
           == net::Disposition::close);
    assert(error_reason(mgr.drain_messages(s)) == "origin_not_allowed");
    assert(!s->joined);

    // Accepted join answers with the assigned id and cleaned name.
    assert(net::handle_client_message(s, join_msg("  Alice\t", "ranger", "https://play.example"), opts)
           == net::Disposition::keep);
    assert(s->joined && s->name == "Alice" && s->class_name == "ranger");
    auto out = mgr.drain_messages(s);
    const auto *joined = test::last_of(out, PC::kJoined);
    assert(joined && joined->joined().player_id() == s->player_id && joined->joined().name() == "Alice");
    assert(!s->in_queue);

    // Queue handling.
    net::handle_client_message(s, queue_msg("ctf"), opts);
    assert(error_reason(mgr.drain_messages(s)) == "invalid_mode");
    net::handle_client_message(s, queue_msg("ffa"), opts);
    out = mgr.drain_messages(s);
    const auto *qu = test::last_of(out, PC::kQueueUpdate);
    assert(qu && qu->queue_update().mode() == "ffa" && qu->queue_update().position() == 1);
    assert(s->in_queue);
    arena::ClientMessage cancel;
    cancel.mutable_queue_cancel();
    net::handle_client_message(s, cancel, opts);
    assert(!s->in_queue);

    // Input is stored for the next tick.
    arena::ClientMessage input;
    input.mutable_input()->set_x(-1.f);
    input.mutable_input()->set_client_tick(3);
    net::handle_client_message(s, input, opts);
    assert(mgr.get_input_copy(s).x == -1.f);

    // Casting and chatting need an active match.
    arena::ClientMessage cast;
    cast.mutable_cast()->set_slot(2);
    cast.mutable_cast()->set_target_id("mob_1");
    cast.mutable_cast()->set_aim_x(10.f);
    net::handle_client_message(s, cast, opts);
    assert(error_reason(mgr.drain_messages(s)) == "not_in_match");
    assert(mgr.drain_commands(s).empty());

    // Ping is answered with the same timestamp.
    arena::ClientMessage ping;
    ping.mutable_ping()->set_ts(77);
    net::handle_client_message(s, ping, opts);
    out = mgr.drain_messages(s);
    const auto *pong = test::last_of(out, PC::kPong);
    assert(pong && pong->pong().ts() == 77);

    // Empty envelopes are counted and otherwise ignored.
    const uint64_t malformed_before = metrics::runtime().malformed_messages.load();
    assert(net::handle_client_message(s, arena::ClientMessage{}, opts) == net::Disposition::keep);
    assert(metrics::runtime().malformed_messages.load() == malformed_before + 1);
    assert(mgr.drain_messages(s).empty());

    // Inside an active match: no requeue, commands are staged verbatim.
    game::GameMode world_mode;
    world_mode.name = "world";
    world_mode.min_players = 1;
    world_mode.persistent = true;
    auto ctx = std::make_shared<game::MatchContext>("m_live", world_mode, test::make_world(), 0);
    mgr.bind_match(s, ctx, ctx->match_id);
    ctx->request_join(s);
    assert(game::advance_match(*ctx, 0));
    assert(net::in_live_match(s));
    mgr.drain_messages(s);
    net::handle_client_message(s, queue_msg("ffa"), opts);
    assert(error_reason(mgr.drain_messages(s)) == "already_in_match");
    assert(!s->in_queue);
    net::handle_client_message(s, cast, opts);
    arena::ClientMessage chat;
    chat.mutable_chat()->set_text("gg");
    chat.mutable_chat()->set_chat_id("c9");
    net::handle_client_message(s, chat, opts);
    auto cmds = mgr.drain_commands(s);
    assert(cmds.size() == 2);
    const auto &staged = std::get<mm::CastCommand>(cmds[0]).request;
    assert(staged.slot == 2 && staged.target_id && *staged.target_id == "mob_1");
    // Half an aim point is no aim point.
    assert(!staged.aim && !staged.angle);
    assert(std::get<mm::ChatCommand>(cmds[1]).chat_id == "c9");

    // Auto-queue on join unless already playing.
    net::ListenerOptions auto_opts;
    auto_opts.auto_queue_mode = "world";
    auto fresh = test::make_session(sched);
    net::handle_client_message(fresh, join_msg("", "warrior"), auto_opts);
    assert(fresh->name == "Player" + fresh->player_id);
    assert(fresh->in_queue && fresh->queue_mode == "world");
    net::handle_client_message(s, join_msg("Alice", "ranger"), auto_opts);
    assert(!s->in_queue);

    mgr.disconnect_session(s);
    mgr.disconnect_session(fresh);
    std::cout << "unit_message_handler OK" << std::endl;
    return 0;
}
