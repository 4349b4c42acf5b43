// SPDX-License-Identifier: Apache-2.0
#include "server/game/content.hpp"

#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace arena::game {

namespace {

constexpr float kSpawnGridDivisions = 20.f;

ProjectileSpec projectile(float damage, float speed, float radius, uint32_t ttl_ms, uint32_t stun_ms = 0)
{
    ProjectileSpec p;
    p.damage = damage;
    p.speed = speed;
    p.radius = radius;
    p.ttl_ms = ttl_ms;
    p.stun_ms = stun_ms;
    return p;
}

// Zero or negative tuning values mean "use the default".
void apply_projectile_defaults(ProjectileSpec &p, float default_speed)
{
    if (p.damage <= 0.f)
        p.damage = 10.f;
    if (p.speed <= 0.f)
        p.speed = default_speed;
    if (p.radius <= 0.f)
        p.radius = 6.f;
    if (p.ttl_ms == 0)
        p.ttl_ms = 3000;
}

BuffStat parse_buff_stat(const std::string &s)
{
    if (s == "speed")
        return BuffStat::speed;
    if (s == "damage")
        return BuffStat::damage;
    throw std::runtime_error("content: unknown buff stat '" + s + "'");
}

BuffSpec parse_buff(const YAML::Node &n)
{
    BuffSpec b;
    if (n["stat"])
        b.stat = parse_buff_stat(n["stat"].as<std::string>());
    if (n["multiplier"])
        b.multiplier = n["multiplier"].as<float>();
    if (n["duration_ms"])
        b.duration_ms = n["duration_ms"].as<uint32_t>();
    return b;
}

ProjectileSpec parse_projectile(const YAML::Node &n)
{
    ProjectileSpec p{0.f, 0.f, 0.f, 0, 0, 0.f};
    if (n["damage"])
        p.damage = n["damage"].as<float>();
    if (n["speed"])
        p.speed = n["speed"].as<float>();
    if (n["radius"])
        p.radius = n["radius"].as<float>();
    if (n["ttl_ms"])
        p.ttl_ms = n["ttl_ms"].as<uint32_t>();
    if (n["stun_ms"])
        p.stun_ms = n["stun_ms"].as<uint32_t>();
    if (n["explode_radius"])
        p.explode_radius = n["explode_radius"].as<float>();
    return p;
}

SkillDef parse_skill(const YAML::Node &n)
{
    SkillDef s;
    if (!n["kind"])
        throw std::runtime_error("content: skill without 'kind'");
    s.kind = n["kind"].as<std::string>();
    s.name = n["name"] ? n["name"].as<std::string>() : s.kind;
    if (n["cooldown_ms"])
        s.cooldown_ms = n["cooldown_ms"].as<uint32_t>();
    const float damage = n["damage"] ? n["damage"].as<float>() : 0.f;
    if (s.kind == "melee") {
        MeleeSkill m{damage, 48.f};
        if (n["range"] && n["range"].as<float>() > 0.f)
            m.range = n["range"].as<float>();
        s.effect = m;
    } else if (s.kind == "aoe" || s.kind == "aoe_stun") {
        AreaSkill a;
        a.damage = damage;
        if (n["radius"] && n["radius"].as<float>() > 0.f)
            a.radius = n["radius"].as<float>();
        if (s.kind == "aoe_stun")
            a.stun_ms = n["stun_ms"] ? n["stun_ms"].as<uint32_t>() : 3000;
        if (n["buff"])
            a.self_buff = parse_buff(n["buff"]);
        s.effect = a;
    } else if (s.kind == "buff") {
        if (!n["buff"])
            throw std::runtime_error("content: buff skill '" + s.name + "' has no 'buff' block");
        s.effect = BuffSkill{parse_buff(n["buff"])};
    } else if (s.kind == "proj_target" || s.kind == "proj_target_stun") {
        auto p = parse_projectile(n);
        apply_projectile_defaults(p, 500.f);
        s.effect = TargetProjectileSkill{p};
    } else if (s.kind == "proj_burst") {
        BurstSkill b;
        b.projectile = parse_projectile(n);
        apply_projectile_defaults(b.projectile, 500.f);
        if (n["count"] && n["count"].as<uint32_t>() > 0)
            b.count = n["count"].as<uint32_t>();
        if (n["spread_deg"] && n["spread_deg"].as<float>() > 0.f)
            b.spread_deg = n["spread_deg"].as<float>();
        s.effect = b;
    } else if (s.kind == "proj_aoe_spread") {
        SpreadSkill sp;
        sp.projectile = parse_projectile(n);
        apply_projectile_defaults(sp.projectile, 400.f);
        if (n["count"] && n["count"].as<uint32_t>() > 0)
            sp.count = n["count"].as<uint32_t>();
        if (n["spread_deg"] && n["spread_deg"].as<float>() > 0.f)
            sp.spread_deg = n["spread_deg"].as<float>();
        s.effect = sp;
    } else {
        PulseSkill p{damage, 48.f};
        if (n["radius"] && n["radius"].as<float>() > 0.f)
            p.radius = n["radius"].as<float>();
        s.effect = p;
    }
    return s;
}

MobDef parse_mob(const std::string &type, const YAML::Node &n)
{
    MobDef m;
    m.type = type;
    if (n["max_hp"])
        m.max_hp = n["max_hp"].as<float>();
    if (n["atk"])
        m.atk = n["atk"].as<float>();
    if (n["speed"])
        m.speed = n["speed"].as<float>();
    if (n["aggro_radius"])
        m.aggro_radius = n["aggro_radius"].as<float>();
    if (n["xp"])
        m.xp = n["xp"].as<uint32_t>();
    if (n["gold_min"])
        m.gold_min = n["gold_min"].as<uint32_t>();
    if (n["gold_max"])
        m.gold_max = n["gold_max"].as<uint32_t>();
    if (n["respawn_seconds"])
        m.respawn_seconds = n["respawn_seconds"].as<float>();
    if (n["radius"])
        m.radius = n["radius"].as<float>();
    return m;
}

} // namespace

const char *to_string(BuffStat s)
{
    return s == BuffStat::speed ? "speed" : "damage";
}

const MobDef *GameContent::find_mob(std::string_view type) const
{
    auto it = std::find_if(mobs.begin(), mobs.end(), [&](const MobDef &m) { return m.type == type; });
    return it == mobs.end() ? nullptr : &*it;
}

const ClassDef *GameContent::find_class(std::string_view name) const
{
    auto it = std::find_if(classes.begin(), classes.end(), [&](const ClassDef &c) { return c.name == name; });
    return it == classes.end() ? nullptr : &*it;
}

const ClassDef &GameContent::class_or_default(std::string_view name) const
{
    if (const auto *c = find_class(name))
        return *c;
    if (const auto *c = find_class(default_class))
        return *c;
    return classes.front();
}

GameContent default_content(float map_half)
{
    GameContent c;
    c.mobs = {
        MobDef{"goblin", 120.f, 14.f, 140.f, 650.f, 12, 6, 14, 12.f, 40.f},
        MobDef{"wolf", 180.f, 20.f, 170.f, 650.f, 20, 12, 20, 18.f, 40.f},
        MobDef{"golem", 420.f, 34.f, 60.f, 650.f, 60, 20, 40, 25.f, 46.f},
    };

    ClassDef warrior;
    warrior.name = "warrior";
    warrior.skills[0] = SkillDef{"slash", "melee", MeleeSkill{60.f, 48.f}, 3500};
    warrior.skills[1] = SkillDef{"shieldbash", "aoe_stun", AreaSkill{40.f, 48.f, 3000, std::nullopt}, 7000};
    warrior.skills[2] =
        SkillDef{"charge", "aoe", AreaSkill{10.f, 80.f, 0, BuffSpec{BuffStat::speed, 1.5f, 5000}}, 10000};
    warrior.skills[3] = SkillDef{"rage", "buff", BuffSkill{BuffSpec{BuffStat::damage, 1.15f, 10000}}, 25000};

    ClassDef ranger;
    ranger.name = "ranger";
    ranger.skills[0] =
        SkillDef{"arrow", "proj_target", TargetProjectileSkill{projectile(40.f, 680.f, 6.f, 3000)}, 2000};
    ranger.skills[1] = SkillDef{"rapid", "proj_burst", BurstSkill{projectile(20.f, 720.f, 5.f, 2500), 5, 12.f}, 25000};
    ranger.skills[2] = SkillDef{
        "trap", "proj_target_stun", TargetProjectileSkill{projectile(12.f, 380.f, 8.f, 1600, 3000)}, 12000};
    ranger.skills[3] =
        SkillDef{"snipe", "proj_target", TargetProjectileSkill{projectile(120.f, 880.f, 7.f, 3500)}, 4000};

    ClassDef mage;
    mage.name = "mage";
    mage.skills[0] =
        SkillDef{"spark", "proj_target", TargetProjectileSkill{projectile(45.f, 420.f, 10.f, 3000)}, 2500};
    auto fireball = projectile(135.f, 360.f, 10.f, 3000);
    fireball.explode_radius = 90.f;
    mage.skills[1] = SkillDef{"fireball", "proj_target", TargetProjectileSkill{fireball}, 5000};
    mage.skills[2] = SkillDef{
        "frostnova", "proj_target_stun", TargetProjectileSkill{projectile(60.f, 500.f, 6.f, 3000, 3000)}, 25000};
    mage.skills[3] =
        SkillDef{"arcane", "proj_aoe_spread", SpreadSkill{projectile(45.f, 520.f, 12.f, 3200), 6, 45.f}, 10000};

    c.classes = {std::move(warrior), std::move(ranger), std::move(mage)};
    c.default_class = "warrior";

    static constexpr float kGrid[][2] = {
        {-3, 10}, {3, 10}, {8, 6}, {5, 2}, {1, -1}, {4, -4}, {-2, -5}, {-6, -3}, {-7, 1}, {-6, 5}, {-1, 4}};
    const float unit = map_half * 2.f / kSpawnGridDivisions;
    for (const auto &g : kGrid) {
        SpawnPointDef sp;
        sp.pos = b2Vec2{g[0] * unit, g[1] * unit};
        sp.mobs = {{"goblin", 5}, {"golem", 2}, {"wolf", 3}};
        c.spawn_points.push_back(std::move(sp));
    }
    return c;
}

void validate_content(const GameContent &content)
{
    if (content.mobs.empty())
        throw std::runtime_error("content: no mob definitions");
    for (const auto &m : content.mobs) {
        if (m.max_hp <= 0.f)
            throw std::runtime_error("content: mob '" + m.type + "' has non-positive max_hp");
        if (m.radius <= 0.f)
            throw std::runtime_error("content: mob '" + m.type + "' has non-positive radius");
        if (m.gold_min > m.gold_max)
            throw std::runtime_error("content: mob '" + m.type + "' has gold_min > gold_max");
    }
    if (content.classes.empty())
        throw std::runtime_error("content: no classes");
    if (!content.find_class(content.default_class))
        throw std::runtime_error("content: default_class '" + content.default_class + "' is not defined");
    for (const auto &sp : content.spawn_points) {
        for (const auto &[type, count] : sp.mobs) {
            if (!content.find_mob(type))
                throw std::runtime_error("content: spawn point references unknown mob '" + type + "'");
        }
    }
}

GameContent parse_content(const YAML::Node &root, float map_half)
{
    GameContent c;
    if (root["mobs"]) {
        for (const auto &kv : root["mobs"])
            c.mobs.push_back(parse_mob(kv.first.as<std::string>(), kv.second));
    }
    if (root["classes"]) {
        for (const auto &kv : root["classes"]) {
            ClassDef cls;
            cls.name = kv.first.as<std::string>();
            const YAML::Node &body = kv.second;
            if (body["damage_mul"])
                cls.damage_mul = body["damage_mul"].as<float>();
            const YAML::Node skills = body["skills"];
            if (!skills || !skills.IsSequence() || skills.size() != kSkillSlots)
                throw std::runtime_error("content: class '" + cls.name + "' must define exactly 4 skills");
            for (size_t i = 0; i < kSkillSlots; ++i)
                cls.skills[i] = parse_skill(skills[i]);
            c.classes.push_back(std::move(cls));
        }
    }
    if (root["default_class"])
        c.default_class = root["default_class"].as<std::string>();
    else if (!c.classes.empty())
        c.default_class = c.classes.front().name;
    float divisions = kSpawnGridDivisions;
    if (root["spawn_grid_divisions"])
        divisions = root["spawn_grid_divisions"].as<float>();
    if (divisions <= 0.f)
        throw std::runtime_error("content: spawn_grid_divisions must be positive");
    const float unit = map_half * 2.f / divisions;
    if (root["spawn_points"]) {
        for (const auto &n : root["spawn_points"]) {
            SpawnPointDef sp;
            sp.pos = b2Vec2{n["x"].as<float>() * unit, n["y"].as<float>() * unit};
            if (n["mobs"]) {
                for (const auto &kv : n["mobs"])
                    sp.mobs.emplace_back(kv.first.as<std::string>(), kv.second.as<uint32_t>());
            }
            c.spawn_points.push_back(std::move(sp));
        }
    }
    validate_content(c);
    return c;
}

GameContent load_content(const std::string &path, float map_half)
{
    if (path.empty() || !std::filesystem::exists(path)) {
        arena::log::info("[content] '{}' not found, using built-in tables", path);
        return default_content(map_half);
    }
    YAML::Node root = YAML::LoadFile(path);
    auto content = parse_content(root, map_half);
    arena::log::info(
        "[content] loaded {} mob types, {} classes, {} spawn points from {}",
        content.mobs.size(),
        content.classes.size(),
        content.spawn_points.size(),
        path);
    return content;
}

} // namespace arena::game
