// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "game.pb.h"
#include "server/game/events.hpp"
#include "server/game/world.hpp"
#include "server/matchmaking/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace arena::game {

struct GameMode
{
    std::string name{"ffa"};
    uint32_t min_players{4};
    uint32_t max_players{10};
    uint32_t countdown_ms{120000};
    uint32_t duration_ms{1800000};
    // Persistent modes start immediately, never finish and accept joins while active.
    bool persistent{false};
};

enum class MatchState
{
    countdown,
    active,
    finished,
    cancelled
};

const char *to_string(MatchState s);

struct MatchContext
{
    MatchContext(std::string id, GameMode game_mode, World w, TimeMs now);

    std::string match_id;
    GameMode mode;
    MatchState state{MatchState::countdown};
    World world;
    // Sessions adopted by the match, in join order. Only the match task touches this list.
    std::vector<std::shared_ptr<arena::mm::Session>> players;
    TimeMs created_at{0};
    TimeMs countdown_until{0};
    TimeMs started_at{0};
    TimeMs finished_at{0};
    TimeMs last_countdown_broadcast{0};
    uint32_t finished_grace_ms{30000};
    size_t results_top_n{5};
    // Gauge contributions last published to the runtime counters
    uint64_t reported_mobs{0};
    uint64_t reported_projectiles{0};
    uint64_t reported_players{0};
    std::atomic<bool> done{false};

    // Thread-safe hand-off from the matchmaker; applied at the start of the next advance.
    // Once the match is cancelled or finished the session is released and requeued instead.
    void request_join(std::shared_ptr<arena::mm::Session> s);
    // Roster size including joins not yet applied.
    size_t expected_players() const;
    bool accepting_joins() const;
    // State as last published by the match task; safe to read from other tasks.
    MatchState current_state() const { return m_published_state.load(std::memory_order_acquire); }

private:
    mutable std::mutex m_join_mutex;
    std::vector<std::shared_ptr<arena::mm::Session>> m_pending;
    bool m_closed{false};
    std::atomic<MatchState> m_published_state{MatchState::countdown};
    std::atomic<size_t> m_roster_size{0};

    friend bool advance_match(MatchContext &ctx, TimeMs now);
};

Roster roster_of(const MatchContext &ctx);

// One synchronous lifecycle step (joins, disconnects, countdown, tick, finish, grace).
// Returns false once the context can be dropped.
bool advance_match(MatchContext &ctx, TimeMs now);

coro::task<void> run_match(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<MatchContext> ctx);

} // namespace arena::game
