// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/content.hpp"
#include "server/game/map_layout.hpp"
#include "server/game/match.hpp"
#include "server/game/world.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace arena::mm {

inline std::vector<arena::game::GameMode> default_modes()
{
    arena::game::GameMode ffa; // 4..10 players, 2 min countdown, 30 min rounds
    arena::game::GameMode world;
    world.name = "world";
    world.min_players = 1;
    world.max_players = 64;
    world.countdown_ms = 0;
    world.duration_ms = 0;
    world.persistent = true;
    return {ffa, world};
}

struct MatchConfig
{
    std::vector<arena::game::GameMode> modes{default_modes()};
    uint32_t tick_rate{20};
    uint32_t poll_interval_ms{1000};
    // Minimum spacing between two new matches of the same mode (a full queue bypasses it)
    uint32_t create_interval_ms{5000};
    uint32_t finished_grace_ms{30000};
    uint32_t results_top_n{5};
    arena::game::SimulationConfig sim;
    std::shared_ptr<const arena::game::GameContent> content;
    arena::game::MapLayout layout;
    // Optional fixed seed override; when >0 match n uses fixed_seed + n instead of random_seed()
    uint32_t fixed_seed{0};
};

const arena::game::GameMode *find_mode(const MatchConfig &cfg, std::string_view name);

// Matchmaker bookkeeping, kept apart from the coroutine so polls can be driven directly.
struct MatchmakerState
{
    std::vector<std::shared_ptr<arena::game::MatchContext>> matches;
    uint64_t next_match_id{1};
    std::unordered_map<std::string, arena::game::TimeMs> last_created_at;
};

std::shared_ptr<arena::game::MatchContext> create_match(
    MatchmakerState &state,
    const MatchConfig &cfg,
    const arena::game::GameMode &mode,
    arena::game::TimeMs now);

// One matchmaking pass over every mode queue. Returns the matches created by this pass (not yet running).
std::vector<std::shared_ptr<arena::game::MatchContext>> matchmaker_poll(
    MatchmakerState &state,
    const MatchConfig &cfg,
    arena::game::TimeMs now);

coro::task<void> run_matchmaker(std::shared_ptr<coro::io_scheduler> scheduler, MatchConfig cfg);

} // namespace arena::mm
