// SPDX-License-Identifier: Apache-2.0
// content.hpp - static game tables: mob species, class skill sets and mob spawn points
#pragma once
#include <box2d/math_functions.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace YAML {
class Node;
}

namespace arena::game {

struct MobDef
{
    std::string type;
    float max_hp{100.f};
    float atk{10.f};
    float speed{100.f};
    float aggro_radius{650.f};
    uint32_t xp{0};
    uint32_t gold_min{0};
    uint32_t gold_max{0};
    float respawn_seconds{10.f};
    float radius{18.f};
};

enum class BuffStat
{
    speed,
    damage
};

const char *to_string(BuffStat s);

struct BuffSpec
{
    BuffStat stat{BuffStat::damage};
    float multiplier{1.f};
    uint32_t duration_ms{0};
};

struct ProjectileSpec
{
    float damage{10.f};
    float speed{500.f};
    float radius{6.f};
    uint32_t ttl_ms{3000};
    uint32_t stun_ms{0};
    // >0: area damage around the first impact point
    float explode_radius{0.f};
};

// melee
struct MeleeSkill
{
    float damage{0.f};
    float range{48.f};
};

// aoe / aoe_stun (stun_ms > 0)
struct AreaSkill
{
    float damage{0.f};
    float radius{48.f};
    uint32_t stun_ms{0};
    std::optional<BuffSpec> self_buff;
};

// buff
struct BuffSkill
{
    BuffSpec buff;
};

// proj_target / proj_target_stun
struct TargetProjectileSkill
{
    ProjectileSpec projectile;
};

// proj_burst: evenly spaced fan around the aim angle
struct BurstSkill
{
    ProjectileSpec projectile;
    uint32_t count{3};
    float spread_deg{12.f};
};

// proj_aoe_spread: random scatter around the aim angle or aim point
struct SpreadSkill
{
    ProjectileSpec projectile;
    uint32_t count{5};
    float spread_deg{45.f};
};

// Any other kind: caster-centred pulse.
struct PulseSkill
{
    float damage{0.f};
    float radius{48.f};
};

using SkillEffect =
    std::variant<MeleeSkill, AreaSkill, BuffSkill, TargetProjectileSkill, BurstSkill, SpreadSkill, PulseSkill>;

struct SkillDef
{
    std::string name;
    std::string kind;
    SkillEffect effect;
    uint32_t cooldown_ms{6000};
};

inline bool requires_target(const SkillDef &s)
{
    return std::holds_alternative<TargetProjectileSkill>(s.effect);
}

constexpr size_t kSkillSlots = 4;

struct ClassDef
{
    std::string name;
    float damage_mul{1.f};
    std::array<SkillDef, kSkillSlots> skills;
};

struct SpawnPointDef
{
    b2Vec2 pos{0.f, 0.f};
    // (mob type, count) in spawn order
    std::vector<std::pair<std::string, uint32_t>> mobs;
};

struct GameContent
{
    std::vector<MobDef> mobs;
    std::vector<ClassDef> classes;
    std::string default_class{"warrior"};
    std::vector<SpawnPointDef> spawn_points;

    const MobDef *find_mob(std::string_view type) const;
    const ClassDef *find_class(std::string_view name) const;
    // Falls back to default_class for unknown names.
    const ClassDef &class_or_default(std::string_view name) const;
};

// Built-in tables (three mob species, warrior/ranger/mage, eleven spawn points).
GameContent default_content(float map_half);

// Throws std::runtime_error on inconsistent content.
void validate_content(const GameContent &content);

GameContent parse_content(const YAML::Node &root, float map_half);

// Missing file yields default_content(); a malformed file throws.
GameContent load_content(const std::string &path, float map_half);

} // namespace arena::game
