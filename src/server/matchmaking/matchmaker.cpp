// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/matchmaker.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "game.pb.h"
#include "server/game/events.hpp"
#include "server/matchmaking/session_manager.hpp"

#include <coro/coro.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace arena::mm {

namespace {

uint32_t random_seed()
{
    static std::mt19937 rng(std::random_device{}());
    return rng();
}

void assign(const std::shared_ptr<arena::game::MatchContext> &ctx, const std::shared_ptr<Session> &s)
{
    instance().pop_from_queue({s});
    instance().bind_match(s, ctx, ctx->match_id);
    ctx->request_join(s);
}

arena::game::Roster roster_of(const std::vector<std::shared_ptr<Session>> &sessions)
{
    arena::game::Roster r;
    for (auto &s : sessions)
        r.emplace_back(s->player_id, s->name);
    return r;
}

} // namespace

const arena::game::GameMode *find_mode(const MatchConfig &cfg, std::string_view name)
{
    auto it = std::find_if(
        cfg.modes.begin(), cfg.modes.end(), [&](const arena::game::GameMode &m) { return m.name == name; });
    return it == cfg.modes.end() ? nullptr : &*it;
}

std::shared_ptr<arena::game::MatchContext> create_match(
    MatchmakerState &state,
    const MatchConfig &cfg,
    const arena::game::GameMode &mode,
    arena::game::TimeMs now)
{
    const uint64_t n = state.next_match_id++;
    const uint32_t seed = cfg.fixed_seed > 0 ? cfg.fixed_seed + static_cast<uint32_t>(n) : random_seed();
    arena::game::SimulationConfig sim = cfg.sim;
    sim.tick_rate = cfg.tick_rate;
    arena::game::World world(sim, cfg.content, cfg.layout, seed);
    auto ctx = std::make_shared<arena::game::MatchContext>("match_" + std::to_string(n), mode, std::move(world), now);
    ctx->finished_grace_ms = cfg.finished_grace_ms;
    ctx->results_top_n = cfg.results_top_n;
    state.matches.push_back(ctx);
    state.last_created_at[mode.name] = now;
    arena::metrics::inc(arena::metrics::runtime().matches_created);
    arena::log::info("[matchmaker] match created id={} mode={} seed={}", ctx->match_id, mode.name, seed);
    return ctx;
}

std::vector<std::shared_ptr<arena::game::MatchContext>> matchmaker_poll(
    MatchmakerState &state,
    const MatchConfig &cfg,
    arena::game::TimeMs now)
{
    auto &mgr = instance();
    std::vector<std::shared_ptr<arena::game::MatchContext>> created;
    state.matches.erase(
        std::remove_if(
            state.matches.begin(),
            state.matches.end(),
            [](const auto &m) { return m->done.load(std::memory_order_acquire); }),
        state.matches.end());

    for (const auto &mode : cfg.modes) {
        // The persistent world always exists, even before anyone asks for it.
        if (mode.persistent) {
            bool exists = std::any_of(state.matches.begin(), state.matches.end(), [&](const auto &m) {
                return m->mode.name == mode.name;
            });
            if (!exists)
                created.push_back(create_match(state, cfg, mode, now));
        }

        auto queued = mgr.snapshot_queue(mode.name);
        if (queued.empty())
            continue;
        auto next = queued.begin();

        // Top up matches that still take players before opening a new one.
        for (auto &ctx : state.matches) {
            if (ctx->mode.name != mode.name)
                continue;
            std::vector<std::shared_ptr<Session>> joined;
            while (next != queued.end() && ctx->accepting_joins()) {
                assign(ctx, *next);
                joined.push_back(*next);
                ++next;
            }
            if (!joined.empty() && !mode.persistent) {
                auto msg =
                    arena::game::make_match_created(ctx->match_id, mode.name, mode.countdown_ms, roster_of(joined));
                for (auto &s : joined)
                    mgr.push_message(s, msg);
            }
        }

        const size_t waiting = static_cast<size_t>(queued.end() - next);
        if (waiting > 0 && !mode.persistent) {
            auto last = state.last_created_at.find(mode.name);
            const bool spaced = last == state.last_created_at.end()
                || now - last->second >= static_cast<arena::game::TimeMs>(cfg.create_interval_ms);
            if (spaced || waiting >= mode.max_players) {
                auto ctx = create_match(state, cfg, mode, now);
                created.push_back(ctx);
                std::vector<std::shared_ptr<Session>> group;
                while (next != queued.end() && group.size() < mode.max_players) {
                    assign(ctx, *next);
                    group.push_back(*next);
                    ++next;
                }
                auto msg =
                    arena::game::make_match_created(ctx->match_id, mode.name, mode.countdown_ms, roster_of(group));
                for (auto &s : group)
                    mgr.push_message(s, msg);
            }
        }

        // Whoever is still waiting gets its position.
        auto still = mgr.snapshot_queue(mode.name);
        if (still.empty())
            continue;
        auto roster = roster_of(still);
        for (size_t i = 0; i < still.size(); ++i) {
            auto pos = static_cast<uint32_t>(i + 1);
            mgr.push_message(still[i], arena::game::make_queue_update(mode.name, roster, pos));
        }
    }
    return created;
}

coro::task<void> run_matchmaker(std::shared_ptr<coro::io_scheduler> scheduler, MatchConfig cfg)
{
    co_await scheduler->schedule();
    arena::log::info(
        "[matchmaker] started modes={} poll_ms={} tick_rate={}",
        cfg.modes.size(),
        cfg.poll_interval_ms,
        cfg.tick_rate);
    MatchmakerState state;
    while (true) {
        for (auto &ctx : matchmaker_poll(state, cfg, arena::game::steady_now_ms()))
            scheduler->spawn(arena::game::run_match(scheduler, ctx));
        // sleep configured poll interval
        co_await scheduler->yield_for(std::chrono::milliseconds(cfg.poll_interval_ms));
    }
}

} // namespace arena::mm
