// SPDX-License-Identifier: Apache-2.0
// events.hpp - builders for discrete ServerMessage events (combat, social, lifecycle, liveness)
#pragma once
#include "game.pb.h"
#include "server/game/entities.hpp"
#include "server/game/geometry.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arena::game {

struct World;

// Rounded world coordinate for the wire.
int32_t wire_int(float v);

arena::ServerMessage make_mob_hurt(const Mob &mob, float damage, std::string_view source_id);
arena::ServerMessage make_mob_died(const Mob &mob, std::string_view killer_id, uint32_t gold, uint32_t xp);
arena::ServerMessage make_player_hurt(const Player &p, float damage, std::string_view source_id);
arena::ServerMessage make_player_died(const Player &p, std::string_view killer_id, uint64_t gold_lost);
arena::ServerMessage make_player_healed(const Player &p, float amount);
arena::ServerMessage make_stun(
    std::string_view target_id,
    std::string_view kind,
    TimeMs until,
    std::string_view source_id);
arena::ServerMessage make_cast_rejected(uint32_t slot, std::string_view reason);
arena::ServerMessage make_level_up(const Player &p, uint32_t level_ups, float hp_gain);
arena::ServerMessage make_leaderboard_update(const World &world);
arena::ServerMessage make_chat(const Player &p, std::string text, TimeMs ts, std::string chat_id);
arena::ServerMessage make_chat_blocked(std::string_view reason, TimeMs ts);

// Roster entries are (player id, display name).
using Roster = std::vector<std::pair<std::string, std::string>>;

arena::ServerMessage make_joined(std::string_view player_id, std::string_view name);
arena::ServerMessage make_queue_update(std::string_view mode, const Roster &queued, uint32_t position);
arena::ServerMessage make_match_created(
    std::string_view match_id,
    std::string_view mode,
    uint32_t countdown_ms,
    const Roster &roster);
arena::ServerMessage make_match_countdown(std::string_view match_id, uint32_t remaining_ms, const Roster &roster);
arena::ServerMessage make_match_start(
    std::string_view match_id,
    std::string_view mode,
    float map_half,
    uint32_t duration_ms,
    std::span<const geo::Wall> walls,
    const Roster &roster);
arena::ServerMessage make_match_cancelled(std::string_view match_id, std::string_view reason, std::string message);
arena::ServerMessage make_match_finished(std::string_view match_id, const World &world, size_t top_n);
arena::ServerMessage make_error(std::string_view reason, std::string message);
arena::ServerMessage make_ping(uint64_t ts);
arena::ServerMessage make_pong(uint64_t ts);

void fill_wall(arena::Wall *out, const geo::Wall &wall);

} // namespace arena::game
