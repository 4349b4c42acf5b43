// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game.pb.h"
#include "server/game/content.hpp"
#include "server/game/map_layout.hpp"
#include "server/game/world.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace arena::test {

inline std::shared_ptr<const arena::game::GameContent> builtin_content(float map_half = 9000.f)
{
    return std::make_shared<const arena::game::GameContent>(arena::game::default_content(map_half));
}

// World over the built-in content with no walls unless a layout is given. No mobs are spawned.
inline arena::game::World make_world(
    uint32_t seed = 7,
    arena::game::MapLayout layout = arena::game::build_open_layout(),
    arena::game::SimulationConfig cfg = {})
{
    arena::game::World world(cfg, builtin_content(cfg.map_half), std::move(layout), seed);
    // Tests hold entity references across add_player / mob pushes.
    world.players.reserve(32);
    world.mobs.reserve(256);
    return world;
}

inline size_t count_broadcast(const arena::game::World &world, arena::ServerMessage::PayloadCase kind)
{
    return static_cast<size_t>(std::count_if(
        world.outbox.broadcast.begin(), world.outbox.broadcast.end(), [&](const arena::ServerMessage &m) {
            return m.payload_case() == kind;
        }));
}

inline const arena::ServerMessage *find_direct(
    const arena::game::World &world,
    const std::string &player_id,
    arena::ServerMessage::PayloadCase kind)
{
    for (const auto &[id, msg] : world.outbox.direct)
        if (id == player_id && msg.payload_case() == kind)
            return &msg;
    return nullptr;
}

} // namespace arena::test
