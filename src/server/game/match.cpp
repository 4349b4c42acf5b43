// SPDX-License-Identifier: Apache-2.0
#include "server/game/match.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/abilities.hpp"
#include "server/game/chat.hpp"
#include "server/game/simulation.hpp"
#include "server/game/snapshot.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <variant>

namespace arena::game {

namespace {

using SessionPtr = std::shared_ptr<arena::mm::Session>;

void broadcast(const MatchContext &ctx, const arena::ServerMessage &msg)
{
    auto &mgr = arena::mm::instance();
    for (auto &s : ctx.players)
        mgr.push_message(s, msg);
}

// Publishes this match's share of the cross-match gauges as deltas.
void update_gauge(std::atomic<uint64_t> &gauge, uint64_t &reported, uint64_t value)
{
    if (value > reported)
        arena::metrics::inc(gauge, value - reported);
    else if (value < reported)
        arena::metrics::dec(gauge, reported - value);
    reported = value;
}

void publish_gauges(MatchContext &ctx)
{
    auto &rt = arena::metrics::runtime();
    uint64_t mobs = 0;
    for (const auto &m : ctx.world.mobs)
        if (m.alive())
            ++mobs;
    const bool live = ctx.state == MatchState::active;
    update_gauge(rt.mobs_alive, ctx.reported_mobs, live ? mobs : 0);
    update_gauge(rt.projectiles_active, ctx.reported_projectiles, live ? ctx.world.projectiles.size() : 0);
    update_gauge(rt.players_in_matches, ctx.reported_players, live ? ctx.world.players.size() : 0);
}

void admit_to_world(MatchContext &ctx, const SessionPtr &s, TimeMs now)
{
    if (ctx.world.find_player(s->player_id))
        return;
    Player &p = ctx.world.add_player(s->player_id, s->name, s->class_name);
    p.invulnerable_until = now + ctx.world.cfg.respawn_invulnerability_ms;
    arena::mm::instance().push_message(s, make_welcome(ctx.world, p, ctx.match_id));
}

void start_match(MatchContext &ctx, TimeMs now)
{
    ctx.state = MatchState::active;
    ctx.started_at = now;
    ctx.world.last_heal_at = now;
    ctx.world.spawn_initial_mobs();
    broadcast(
        ctx,
        make_match_start(
            ctx.match_id,
            ctx.mode.name,
            ctx.world.cfg.map_half,
            ctx.mode.duration_ms,
            ctx.world.walls(),
            roster_of(ctx)));
    for (auto &s : ctx.players)
        admit_to_world(ctx, s, now);
    arena::metrics::inc(arena::metrics::runtime().active_matches);
    arena::log::info(
        "[match] start id={} mode={} players={} mobs={}",
        ctx.match_id,
        ctx.mode.name,
        ctx.players.size(),
        ctx.world.mobs.size());
}

// Unbinds a session from a match that will not run it and puts it back in the mode's queue.
void requeue_session(const MatchContext &ctx, const SessionPtr &s)
{
    auto &mgr = arena::mm::instance();
    if (!mgr.release_match(s, &ctx) || !mgr.is_connected(s))
        return;
    if (mgr.enqueue(s, ctx.mode.name)) {
        Roster queued;
        for (auto &q : mgr.snapshot_queue(ctx.mode.name))
            queued.emplace_back(q->player_id, q->name);
        mgr.push_message(s, make_queue_update(ctx.mode.name, queued, mgr.queue_position(s)));
    }
}

void cancel_match(MatchContext &ctx, TimeMs now)
{
    const std::string message = "Match cancelled: not enough players joined (" + std::to_string(ctx.players.size())
        + "/" + std::to_string(ctx.mode.min_players) + ")";
    broadcast(ctx, make_match_cancelled(ctx.match_id, "insufficient_players", message));
    for (auto &s : ctx.players)
        requeue_session(ctx, s);
    ctx.state = MatchState::cancelled;
    ctx.finished_at = now;
    arena::metrics::inc(arena::metrics::runtime().matches_cancelled);
    arena::log::info("[match] cancelled id={} players={}/{}", ctx.match_id, ctx.players.size(), ctx.mode.min_players);
}

void finish_match(MatchContext &ctx, TimeMs now)
{
    broadcast(ctx, make_match_finished(ctx.match_id, ctx.world, ctx.results_top_n));
    ctx.state = MatchState::finished;
    ctx.finished_at = now;
    arena::metrics::inc(arena::metrics::runtime().matches_finished);
    arena::metrics::dec(arena::metrics::runtime().active_matches);
    const auto top = top_players_by_kills(ctx.world, 1);
    arena::log::info(
        "[match] finished id={} players={} leader={}",
        ctx.match_id,
        ctx.world.players.size(),
        top.empty() ? std::string("-") : top.front()->id);
}

void release_players(MatchContext &ctx)
{
    for (auto &s : ctx.players)
        arena::mm::instance().release_match(s, &ctx);
}

void apply_chat(
    MatchContext &ctx,
    const SessionPtr &s,
    const Player &p,
    const arena::mm::ChatCommand &chat,
    TimeMs now)
{
    auto &mgr = arena::mm::instance();
    if (!s->chat_limiter.allow(now)) {
        mgr.push_message(s, make_chat_blocked("rate_limit", now));
        arena::metrics::inc(arena::metrics::runtime().chat_blocked);
        return;
    }
    std::string text = sanitize_chat_text(chat.text);
    if (text.empty())
        return;
    ctx.world.emit(make_chat(p, std::move(text), now, chat.chat_id));
    arena::metrics::inc(arena::metrics::runtime().chat_relayed);
}

// Inbound intents are applied here and nowhere else, before the simulation step.
void apply_staged_intents(MatchContext &ctx, TimeMs now)
{
    auto &mgr = arena::mm::instance();
    for (auto &s : ctx.players) {
        Player *p = ctx.world.find_player(s->player_id);
        if (!p)
            continue;
        auto in = mgr.get_input_copy(s);
        p->input = b2Vec2{in.x, in.y};
        for (auto &cmd : mgr.drain_commands(s)) {
            try {
                if (const auto *cast = std::get_if<arena::mm::CastCommand>(&cmd))
                    cast_skill(ctx.world, *p, cast->request, now);
                else
                    apply_chat(ctx, s, *p, std::get<arena::mm::ChatCommand>(cmd), now);
            } catch (const std::exception &e) {
                arena::metrics::inc(arena::metrics::runtime().message_faults);
                arena::log::error(
                    "[match] command fault id={} player={} what={}", ctx.match_id, s->player_id, e.what());
                mgr.push_message(s, make_error("server_error", "internal error while handling request"));
            }
        }
    }
}

void fan_out(MatchContext &ctx)
{
    auto &mgr = arena::mm::instance();
    auto &out = ctx.world.outbox;
    for (const auto &msg : out.broadcast) {
        if (msg.has_snapshot())
            arena::metrics::add_snapshot(msg.ByteSizeLong());
        else
            arena::metrics::inc(arena::metrics::snapshot().event_messages);
        broadcast(ctx, msg);
    }
    for (const auto &[player_id, msg] : out.direct) {
        auto it = std::find_if(
            ctx.players.begin(), ctx.players.end(), [&](const SessionPtr &s) { return s->player_id == player_id; });
        if (it != ctx.players.end())
            mgr.push_message(*it, msg);
    }
    out.clear();
}

void apply_joins_and_leaves(MatchContext &ctx, std::vector<SessionPtr> joins, TimeMs now)
{
    auto &mgr = arena::mm::instance();
    for (auto &s : joins) {
        if (!mgr.is_connected(s))
            continue;
        if (std::find(ctx.players.begin(), ctx.players.end(), s) != ctx.players.end())
            continue;
        // Anything staged while queued belongs to no match.
        mgr.drain_commands(s);
        ctx.players.push_back(s);
        arena::log::debug("[match] join id={} player={} state={}", ctx.match_id, s->player_id, to_string(ctx.state));
        if (ctx.state == MatchState::active)
            admit_to_world(ctx, s, now);
        else if (ctx.state == MatchState::countdown) {
            const auto remaining = static_cast<uint32_t>(std::max<TimeMs>(0, ctx.countdown_until - now));
            broadcast(ctx, make_match_countdown(ctx.match_id, remaining, roster_of(ctx)));
        }
    }
    auto gone = std::stable_partition(ctx.players.begin(), ctx.players.end(), [&](const SessionPtr &s) {
        if (!mgr.is_connected(s))
            return false;
        auto bound = mgr.match_of(s);
        return !bound || bound.get() == static_cast<const void *>(&ctx);
    });
    for (auto it = gone; it != ctx.players.end(); ++it) {
        if (ctx.world.remove_player((*it)->player_id))
            arena::log::info("[match] player left id={} player={}", ctx.match_id, (*it)->player_id);
    }
    ctx.players.erase(gone, ctx.players.end());
}

} // namespace

const char *to_string(MatchState s)
{
    switch (s) {
        case MatchState::countdown:
            return "countdown";
        case MatchState::active:
            return "active";
        case MatchState::finished:
            return "finished";
        case MatchState::cancelled:
            return "cancelled";
    }
    return "unknown";
}

MatchContext::MatchContext(std::string id, GameMode game_mode, World w, TimeMs now)
    : match_id(std::move(id))
    , mode(std::move(game_mode))
    , world(std::move(w))
    , created_at(now)
    , countdown_until(now + static_cast<TimeMs>(mode.countdown_ms))
    , last_countdown_broadcast(now)
{}

void MatchContext::request_join(std::shared_ptr<arena::mm::Session> s)
{
    {
        std::scoped_lock lk{m_join_mutex};
        if (!m_closed) {
            m_pending.push_back(std::move(s));
            return;
        }
    }
    requeue_session(*this, s);
}

size_t MatchContext::expected_players() const
{
    std::scoped_lock lk{m_join_mutex};
    return m_roster_size.load(std::memory_order_acquire) + m_pending.size();
}

bool MatchContext::accepting_joins() const
{
    const MatchState st = current_state();
    const bool open = st == MatchState::countdown || (mode.persistent && st == MatchState::active);
    return open && expected_players() < mode.max_players;
}

Roster roster_of(const MatchContext &ctx)
{
    Roster r;
    r.reserve(ctx.players.size());
    for (const auto &s : ctx.players)
        r.emplace_back(s->player_id, s->name);
    return r;
}

bool advance_match(MatchContext &ctx, TimeMs now)
{
    std::vector<SessionPtr> joins;
    {
        std::scoped_lock lk{ctx.m_join_mutex};
        joins.swap(ctx.m_pending);
    }
    if (ctx.state == MatchState::countdown || ctx.state == MatchState::active) {
        apply_joins_and_leaves(ctx, std::move(joins), now);
    } else {
        for (auto &s : joins)
            requeue_session(ctx, s);
    }

    switch (ctx.state) {
        case MatchState::countdown: {
            const TimeMs remaining = ctx.countdown_until - now;
            if (ctx.mode.persistent || ctx.players.size() >= ctx.mode.max_players) {
                start_match(ctx, now);
            } else if (remaining <= 0) {
                if (ctx.players.size() >= ctx.mode.min_players)
                    start_match(ctx, now);
                else
                    cancel_match(ctx, now);
            } else if (now - ctx.last_countdown_broadcast >= 1000) {
                ctx.last_countdown_broadcast = now;
                broadcast(ctx, make_match_countdown(ctx.match_id, static_cast<uint32_t>(remaining), roster_of(ctx)));
            }
            break;
        }
        case MatchState::active:
            apply_staged_intents(ctx, now);
            tick(ctx.world, now);
            passive_heal(ctx.world, now);
            ARENA_LOG_EVERY_N(
                debug,
                200,
                "[match] id={} tick={} players={} mobs={} projectiles={}",
                ctx.match_id,
                ctx.world.server_tick,
                ctx.world.players.size(),
                ctx.world.mobs.size(),
                ctx.world.projectiles.size());
            fan_out(ctx);
            if (!ctx.mode.persistent && now - ctx.started_at >= static_cast<TimeMs>(ctx.mode.duration_ms))
                finish_match(ctx, now);
            break;
        case MatchState::finished:
            if (now - ctx.finished_at >= static_cast<TimeMs>(ctx.finished_grace_ms)) {
                release_players(ctx);
                publish_gauges(ctx);
                ctx.m_published_state.store(ctx.state, std::memory_order_release);
                return false;
            }
            break;
        case MatchState::cancelled:
            break;
    }

    if (ctx.state == MatchState::cancelled || ctx.state == MatchState::finished) {
        // Joins racing the transition are bounced back to the queue instead of parked here.
        std::vector<SessionPtr> late;
        {
            std::scoped_lock lk{ctx.m_join_mutex};
            ctx.m_closed = true;
            late.swap(ctx.m_pending);
        }
        for (auto &s : late)
            requeue_session(ctx, s);
    }

    publish_gauges(ctx);
    ctx.m_roster_size.store(ctx.players.size(), std::memory_order_release);
    ctx.m_published_state.store(ctx.state, std::memory_order_release);
    return ctx.state != MatchState::cancelled;
}

coro::task<void> run_match(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<MatchContext> ctx)
{
    co_await scheduler->schedule();
    arena::log::info(
        "[match] created id={} mode={} countdown_ms={} tick_rate={}",
        ctx->match_id,
        ctx->mode.name,
        ctx->mode.countdown_ms,
        ctx->world.cfg.tick_rate);
    using clock = std::chrono::steady_clock;
    const uint32_t rate = std::max<uint32_t>(1, ctx->world.cfg.tick_rate);
    // Precise tick interval in nanoseconds to avoid integer millisecond truncation.
    auto tick_interval = std::chrono::nanoseconds((1'000'000'000ull + rate / 2) / rate);
    auto next = clock::now();
    while (true) {
        auto now = clock::now();
        if (now < next) {
            auto wait_dur = next - now;
            arena::metrics::add_wait_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
            co_await scheduler->yield_for(wait_dur);
            continue;
        }
        auto tick_start = now;
        next += tick_interval;
        // Never try to catch up more than one interval after a stall.
        if (next < now)
            next = now + tick_interval;
        bool keep = true;
        try {
            keep = advance_match(*ctx, steady_now_ms());
        } catch (const std::exception &e) {
            arena::metrics::inc(arena::metrics::runtime().tick_faults);
            arena::log::error(
                "[match] tick fault id={} tick={} what={}", ctx->match_id, ctx->world.server_tick, e.what());
            ctx->world.outbox.clear();
        }
        auto tick_end = clock::now();
        arena::metrics::add_tick_duration(
            std::chrono::duration_cast<std::chrono::nanoseconds>(tick_end - tick_start).count());
        if (!keep)
            break;
    }
    ctx->done.store(true, std::memory_order_release);
    arena::log::info("[match] closed id={} state={}", ctx->match_id, to_string(ctx->state));
}

} // namespace arena::game
