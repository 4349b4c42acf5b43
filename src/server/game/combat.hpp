// SPDX-License-Identifier: Apache-2.0
// combat.hpp - damage, death, loot and progression rules
// Every entry point is a silent no-op on dead targets: hits race with each other and with respawns inside a tick.
#pragma once
#include "server/game/world.hpp"

#include <cstdint>
#include <string>

namespace arena::game {

// Subtracts hp, records the attacker's contribution and resolves death at most once.
void damage_mob(World &world, Mob &mob, float amount, const std::string &attacker_id, TimeMs now);

// Credits the top contributor (ties: earliest first hit) or fallback_killer_id when nobody is on the ledger,
// then schedules the respawn. Idempotent once respawn_at is set.
void handle_mob_death(World &world, Mob &mob, const std::string &fallback_killer_id, TimeMs now);

// Ignored while the target is dead or invulnerable. emit_hurt=false suppresses player_hurt for
// continuous damage (mob contact).
void apply_damage_to_player(
    World &world,
    Player &target,
    float amount,
    const std::string &attacker_id,
    TimeMs now,
    bool emit_hurt = true);

// Transfers a share of gold and a kill to killer_id when it names another player in this world.
void handle_player_death(World &world, Player &victim, const std::string &killer_id);

// Applies the level threshold loop; emits a single player_levelup summarising every level gained.
void award_xp_to_player(World &world, Player &player, uint32_t amount);

// Extends the stun to now + duration_ms (never shortens a longer one) and announces it.
// Dead and invulnerable targets are ignored.
void stun_mob(World &world, Mob &mob, uint32_t duration_ms, const std::string &source_id, TimeMs now);
void stun_player(World &world, Player &player, uint32_t duration_ms, const std::string &source_id, TimeMs now);

// Returns the hp actually restored (capped at max_hp).
float heal_player(World &world, Player &player, float amount);

} // namespace arena::game
