// SPDX-License-Identifier: Apache-2.0
// simulation.hpp - fixed-step world update
// Phase order per tick: mob respawn sweep, mob AI, players, projectiles, snapshot.
#pragma once
#include "server/game/world.hpp"

namespace arena::game {

// Dead mobs whose respawn time has elapsed are replaced in place by fresh instances (new id, full hp).
void respawn_mobs(World &world, TimeMs now);
void update_mobs(World &world, TimeMs now);
// Respawns dead players, integrates input, resolves walls and runs the auto-attack.
void update_players(World &world, TimeMs now);
// TTL expiry first, then movement and a single hit per projectile.
void update_projectiles(World &world, TimeMs now);

// Runs the four update phases without snapshotting.
void step_world(World &world, TimeMs now);

// One full tick: step_world, server_tick++, snapshot appended to the broadcast outbox.
void tick(World &world, TimeMs now);

// Heals every live player by cfg.passive_heal_amount once per cfg.passive_heal_interval_ms.
void passive_heal(World &world, TimeMs now);

} // namespace arena::game
