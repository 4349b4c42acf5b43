// SPDX-License-Identifier: Apache-2.0
// snapshot.hpp - rounded full-state view of a world and the per-player welcome
#pragma once
#include "game.pb.h"
#include "server/game/world.hpp"

#include <string>
#include <string_view>

namespace arena::game {

// Live mobs only; dead players only when cfg.include_dead_players. Walls only when include_walls.
arena::Snapshot build_snapshot(const World &world, TimeMs now, bool include_walls);

arena::ServerMessage make_welcome(const World &world, const Player &player, std::string_view match_id);

} // namespace arena::game
