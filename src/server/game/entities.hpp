// SPDX-License-Identifier: Apache-2.0
// entities.hpp - mutable per-world records for players, mobs and projectiles
#pragma once
#include "server/game/content.hpp"

#include <box2d/math_functions.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena::game {

// Milliseconds on the server's monotonic clock. All simulation entry points take it explicitly.
using TimeMs = int64_t;

TimeMs steady_now_ms();

struct ActiveBuff
{
    BuffStat stat{BuffStat::damage};
    float multiplier{1.f};
    TimeMs until{0};
};

struct Player
{
    std::string id;
    std::string name;
    std::string class_name;
    b2Vec2 pos{0.f, 0.f};
    b2Vec2 vel{0.f, 0.f};
    float radius{28.f};

    float hp{200.f};
    float max_hp{200.f};
    float base_damage{18.f};
    float base_speed{380.f};
    TimeMs attack_cooldown_ms{600};
    TimeMs next_attack_at{0};
    TimeMs invulnerable_until{0};
    TimeMs stunned_until{0};
    std::array<TimeMs, kSkillSlots> cooldown_until{};

    uint32_t xp{0};
    uint32_t level{1};
    uint32_t next_level_xp{100};
    uint64_t gold{0};
    // Persistent multipliers grown every 5th level; class_damage_mul comes from the class table.
    float damage_mul{1.f};
    float buff_duration_mul{1.f};
    float class_damage_mul{1.f};

    std::vector<ActiveBuff> buffs;
    uint32_t kills{0};
    uint32_t deaths{0};
    // Last sanitized movement intent
    b2Vec2 input{0.f, 0.f};

    bool alive() const { return hp > 0.f; }
    bool stunned(TimeMs now) const { return now < stunned_until; }
    bool invulnerable(TimeMs now) const { return now < invulnerable_until; }

    // Drops buffs whose expiry has passed.
    void expire_buffs(TimeMs now);
    // Product of active speed buff multipliers.
    float speed_multiplier() const;
    // Damage buffs times persistent and class multipliers.
    float damage_multiplier() const;
    void apply_buff(const BuffSpec &spec, TimeMs now);
};

// Non-finite components become 0, each component is clamped to [-1,1] and the vector to unit length.
b2Vec2 sanitize_input(float x, float y);

struct DamageShare
{
    std::string attacker_id;
    float amount{0.f};
    TimeMs first_at{0};
    uint64_t seq{0};
};

struct Mob
{
    std::string id;
    const MobDef *def{nullptr};
    b2Vec2 pos{0.f, 0.f};
    b2Vec2 vel{0.f, 0.f};
    float radius{18.f};
    float hp{0.f};
    float max_hp{0.f};
    TimeMs stunned_until{0};
    std::vector<DamageShare> ledger;
    size_t spawn_index{0};
    // Set once on death; the respawn sweep replaces the mob when it elapses.
    std::optional<TimeMs> respawn_at;

    const std::string &type() const { return def->type; }
    bool alive() const { return hp > 0.f; }
    bool stunned(TimeMs now) const { return now < stunned_until; }
    void record_damage(const std::string &attacker_id, float amount, TimeMs now, uint64_t seq);
};

struct Projectile
{
    std::string id;
    std::string owner_id;
    std::string type;
    b2Vec2 pos{0.f, 0.f};
    b2Vec2 vel{0.f, 0.f};
    float radius{6.f};
    float damage{0.f};
    TimeMs expires_at{0};
    uint32_t stun_ms{0};
    float explode_radius{0.f};
    std::optional<std::string> target_id;
};

} // namespace arena::game
