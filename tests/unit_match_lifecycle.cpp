// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "server/game/match.hpp"
#include "test_sessions.hpp"
#include "test_world.hpp"

#include <coro/io_scheduler.hpp>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace arena;
using PC = arena::ServerMessage::PayloadCase;

namespace {

std::shared_ptr<game::MatchContext> make_match(const std::string &id, game::GameMode mode, game::TimeMs now)
{
    auto ctx = std::make_shared<game::MatchContext>(id, std::move(mode), test::make_world(), now);
    ctx->finished_grace_ms = 500;
    return ctx;
}

void assign(const std::shared_ptr<game::MatchContext> &ctx, const std::shared_ptr<mm::Session> &s)
{
    mm::instance().bind_match(s, ctx, ctx->match_id);
    ctx->request_join(s);
}

game::GameMode small_mode(uint32_t min_players, uint32_t max_players)
{
    game::GameMode m;
    m.name = "ffa";
    m.min_players = min_players;
    m.max_players = max_players;
    m.countdown_ms = 1000;
    m.duration_ms = 2000;
    return m;
}

} // namespace

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    auto &mgr = mm::instance();

    // Countdown expires short of the minimum: cancelled, released and requeued.
    {
        auto ctx = make_match("m_cancel", small_mode(2, 4), 0);
        auto s = test::make_joined_session(sched, "lonely");
        assign(ctx, s);
        assert(ctx->expected_players() == 1);
        assert(game::advance_match(*ctx, 0));
        assert(ctx->players.size() == 1);
        assert(test::count_kind(mgr.drain_messages(s), PC::kMatchCountdown) == 1);
        assert(game::advance_match(*ctx, 500));
        assert(!game::advance_match(*ctx, 1000));
        assert(ctx->current_state() == game::MatchState::cancelled);
        auto out = mgr.drain_messages(s);
        const auto *cancelled = test::last_of(out, PC::kMatchCancelled);
        assert(cancelled && cancelled->match_cancelled().reason() == "insufficient_players");
        assert(cancelled->match_cancelled().message().find("1/2") != std::string::npos);
        const auto *queued = test::last_of(out, PC::kQueueUpdate);
        assert(queued && queued->queue_update().mode() == "ffa" && queued->queue_update().position() == 1);
        assert(s->in_queue && !mgr.match_of(s));

        // A join handed over after the cancel is bounced straight back to the queue.
        auto late = test::make_joined_session(sched, "late");
        assign(ctx, late);
        assert(ctx->expected_players() == 1);
        assert(!mgr.match_of(late));
        assert(late->in_queue && late->queue_mode == "ffa");
        const auto *late_update = test::last_of(mgr.drain_messages(late), PC::kQueueUpdate);
        assert(late_update && late_update->queue_update().position() == 2);
        assert(!game::advance_match(*ctx, 1050));
        assert(ctx->players.size() == 1);
        mgr.cancel_queue(late);
        mgr.disconnect_session(late);
        mgr.cancel_queue(s);
        mgr.disconnect_session(s);
    }

    // Full roster starts at once; the match then ticks, applies intents and finishes on time.
    {
        const uint64_t active_before = metrics::runtime().active_matches.load();
        auto ctx = make_match("m_full", small_mode(2, 2), 0);
        auto a = test::make_joined_session(sched, "alice", "warrior");
        auto b = test::make_joined_session(sched, "bob", "mage");
        assign(ctx, a);
        assign(ctx, b);
        assert(!ctx->accepting_joins());
        assert(game::advance_match(*ctx, 100));
        assert(ctx->current_state() == game::MatchState::active);
        assert(metrics::runtime().active_matches.load() == active_before + 1);
        assert(ctx->world.players.size() == 2);
        assert(!ctx->world.mobs.empty());
        auto out = mgr.drain_messages(a);
        const auto *start = test::last_of(out, PC::kMatchStart);
        assert(start && start->match_start().players_size() == 2);
        assert(start->match_start().duration_ms() == 2000);
        const auto *welcome = test::last_of(out, PC::kWelcome);
        assert(welcome && welcome->welcome().player_id() == a->player_id);
        assert(welcome->welcome().match_id() == "m_full");
        // Fresh arrivals are briefly invulnerable.
        assert(ctx->world.find_player(a->player_id)->invulnerable(100));

        // Input and commands staged between ticks are applied on the next one.
        arena::InputCommand in;
        in.set_x(1.f);
        mgr.update_input(a, in);
        game::CastRequest rage;
        rage.slot = 4;
        mgr.stage_command(a, mm::CastCommand{rage});
        mgr.stage_command(b, mm::ChatCommand{"hi\nthere", "c1"});
        mgr.stage_command(b, mm::ChatCommand{"two", "c2"});
        mgr.stage_command(b, mm::ChatCommand{"three", "c3"});
        const uint64_t snapshots_before = metrics::snapshot().count.load();
        assert(game::advance_match(*ctx, 150));
        // One snapshot per tick is counted however many players receive it.
        assert(metrics::snapshot().count.load() == snapshots_before + 1);
        assert(metrics::snapshot().bytes.load() > 0);
        assert(ctx->world.find_player(a->player_id)->input.x == 1.f);
        auto out_b = mgr.drain_messages(b);
        assert(test::count_kind(out_b, PC::kSnapshot) == 1);
        const auto *effect = test::last_of(out_b, PC::kCastEffect);
        assert(effect && effect->cast_effect().caster_id() == a->player_id);
        assert(test::count_kind(out_b, PC::kChat) == 2);
        const auto *blocked = test::last_of(out_b, PC::kChatBlocked);
        assert(blocked && blocked->chat_blocked().reason() == "rate_limit");
        auto out_a = mgr.drain_messages(a);
        assert(test::count_kind(out_a, PC::kChatBlocked) == 0);
        for (const auto &m : out_a) {
            if (m.has_chat() && m.chat().chat_id() == "c1")
                assert(m.chat().text() == "hi there" && m.chat().player_id() == b->player_id);
        }

        assert(game::advance_match(*ctx, 2050));
        assert(ctx->current_state() == game::MatchState::active);
        assert(game::advance_match(*ctx, 2100));
        assert(ctx->current_state() == game::MatchState::finished);
        assert(metrics::runtime().active_matches.load() == active_before);
        out = mgr.drain_messages(b);
        const auto *finished = test::last_of(out, PC::kMatchFinished);
        assert(finished && finished->match_finished().results_size() == 2);
        // Finished matches stop simulating.
        const auto ticks = ctx->world.server_tick;
        assert(game::advance_match(*ctx, 2300));
        assert(ctx->world.server_tick == ticks);
        assert(mgr.match_of(a));
        assert(!game::advance_match(*ctx, 2600));
        assert(!mgr.match_of(a) && !mgr.match_of(b));
        mgr.disconnect_session(a);
        mgr.disconnect_session(b);
    }

    // Persistent mode starts with anyone, admits late joiners and drops leavers.
    {
        game::GameMode world_mode;
        world_mode.name = "world";
        world_mode.min_players = 1;
        world_mode.max_players = 8;
        world_mode.persistent = true;
        auto ctx = make_match("m_world", world_mode, 0);
        auto first = test::make_joined_session(sched, "first");
        assign(ctx, first);
        assert(game::advance_match(*ctx, 0));
        assert(ctx->current_state() == game::MatchState::active);
        assert(ctx->accepting_joins());

        auto late = test::make_joined_session(sched, "late", "ranger");
        assign(ctx, late);
        assert(game::advance_match(*ctx, 50));
        assert(ctx->world.find_player(late->player_id));
        assert(test::last_of(mgr.drain_messages(late), PC::kWelcome));

        mgr.disconnect_session(first);
        assert(game::advance_match(*ctx, 100));
        assert(!ctx->world.find_player(first->player_id));
        assert(ctx->players.size() == 1);

        // Still running long after any finite duration would have elapsed.
        assert(game::advance_match(*ctx, 10'000'000));
        assert(ctx->current_state() == game::MatchState::active);
        mgr.disconnect_session(late);
    }

    std::cout << "unit_match_lifecycle OK" << std::endl;
    return 0;
}
