// SPDX-License-Identifier: Apache-2.0
#include "server/game/combat.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/events.hpp"

#include <algorithm>
#include <cmath>

namespace arena::game {

namespace {

const DamageShare *top_contributor(const std::vector<DamageShare> &ledger)
{
    const DamageShare *best = nullptr;
    for (const auto &d : ledger) {
        if (!best || d.amount > best->amount
            || (d.amount == best->amount
                && (d.first_at < best->first_at || (d.first_at == best->first_at && d.seq < best->seq))))
            best = &d;
    }
    return best;
}

} // namespace

void damage_mob(World &world, Mob &mob, float amount, const std::string &attacker_id, TimeMs now)
{
    if (!mob.alive())
        return;
    mob.hp -= amount;
    if (!attacker_id.empty())
        mob.record_damage(attacker_id, amount, now, world.ledger_seq++);
    world.emit(make_mob_hurt(mob, amount, attacker_id));
    if (mob.hp <= 0.f && !mob.respawn_at)
        handle_mob_death(world, mob, attacker_id, now);
}

void handle_mob_death(World &world, Mob &mob, const std::string &fallback_killer_id, TimeMs now)
{
    if (mob.respawn_at)
        return;
    const DamageShare *top = top_contributor(mob.ledger);
    const std::string killer_id = top ? top->attacker_id : fallback_killer_id;
    Player *killer = killer_id.empty() ? nullptr : world.find_player(killer_id);
    if (killer) {
        std::uniform_int_distribution<uint32_t> gold_roll(mob.def->gold_min, mob.def->gold_max);
        uint32_t gold = gold_roll(world.rng);
        uint32_t xp = mob.def->xp;
        killer->gold += gold;
        award_xp_to_player(world, *killer, xp);
        world.emit(make_mob_died(mob, killer->id, gold, xp));
    } else {
        world.emit(make_mob_died(mob, "", 0, 0));
    }
    mob.respawn_at = now + static_cast<TimeMs>(std::lround(mob.def->respawn_seconds * 1000.f));
    mob.hp = 0.f;
    mob.vel = b2Vec2{0.f, 0.f};
    mob.ledger.clear();
    arena::metrics::inc(arena::metrics::runtime().mob_kills);
    arena::log::debug("[match] mob {} died killer={} respawn_at={}", mob.id, killer_id, *mob.respawn_at);
}

void apply_damage_to_player(
    World &world,
    Player &target,
    float amount,
    const std::string &attacker_id,
    TimeMs now,
    bool emit_hurt)
{
    if (!target.alive() || target.invulnerable(now))
        return;
    target.hp -= amount;
    if (target.hp <= 0.f) {
        handle_player_death(world, target, attacker_id);
        return;
    }
    if (emit_hurt)
        world.emit(make_player_hurt(target, amount, attacker_id));
}

void handle_player_death(World &world, Player &victim, const std::string &killer_id)
{
    uint64_t gold_lost = 0;
    Player *killer = killer_id.empty() || killer_id == victim.id ? nullptr : world.find_player(killer_id);
    if (killer) {
        gold_lost = static_cast<uint64_t>(
            std::floor(static_cast<double>(victim.gold) * static_cast<double>(world.cfg.gold_steal_fraction)));
        gold_lost = std::min(gold_lost, victim.gold);
        victim.gold -= gold_lost;
        killer->gold += gold_lost;
        killer->kills += 1;
        world.emit(make_leaderboard_update(world));
    }
    victim.hp = 0.f;
    victim.vel = b2Vec2{0.f, 0.f};
    victim.deaths += 1;
    world.emit(make_player_died(victim, killer_id, gold_lost));
    arena::metrics::inc(arena::metrics::runtime().player_deaths);
}

void award_xp_to_player(World &world, Player &player, uint32_t amount)
{
    player.xp += amount;
    uint32_t level_ups = 0;
    const float bonus = world.cfg.level_hp_bonus;
    while (player.next_level_xp > 0 && player.xp >= player.next_level_xp) {
        const uint32_t required = player.next_level_xp;
        player.xp -= required;
        player.level += 1;
        player.max_hp += bonus;
        // A dead contributor keeps the max hp gain but stays down until respawn.
        if (player.alive())
            player.hp = std::min(player.max_hp, player.hp + bonus);
        player.next_level_xp = static_cast<uint32_t>(
            std::ceil(static_cast<double>(required) * static_cast<double>(world.cfg.level_xp_growth) - 1e-6));
        ++level_ups;
        if (player.level % 5 == 0) {
            player.damage_mul *= 1.3f;
            player.buff_duration_mul *= 1.1f;
        }
    }
    if (level_ups > 0)
        world.emit(make_level_up(player, level_ups, bonus * static_cast<float>(level_ups)));
}

void stun_mob(World &world, Mob &mob, uint32_t duration_ms, const std::string &source_id, TimeMs now)
{
    if (!mob.alive() || duration_ms == 0)
        return;
    mob.stunned_until = std::max(mob.stunned_until, now + static_cast<TimeMs>(duration_ms));
    mob.vel = b2Vec2{0.f, 0.f};
    world.emit(make_stun(mob.id, "mob", mob.stunned_until, source_id));
}

void stun_player(World &world, Player &player, uint32_t duration_ms, const std::string &source_id, TimeMs now)
{
    if (!player.alive() || player.invulnerable(now) || duration_ms == 0)
        return;
    player.stunned_until = std::max(player.stunned_until, now + static_cast<TimeMs>(duration_ms));
    player.vel = b2Vec2{0.f, 0.f};
    world.emit(make_stun(player.id, "player", player.stunned_until, source_id));
}

float heal_player(World &world, Player &player, float amount)
{
    if (!player.alive() || player.hp >= player.max_hp || amount <= 0.f)
        return 0.f;
    const float applied = std::min(amount, player.max_hp - player.hp);
    player.hp += applied;
    world.emit(make_player_healed(player, applied));
    return applied;
}

} // namespace arena::game
