// SPDX-License-Identifier: Apache-2.0
#include "server/game/world.hpp"

#include <algorithm>

namespace arena::game {

World::World(SimulationConfig config, std::shared_ptr<const GameContent> game_content, MapLayout map, uint32_t seed)
    : cfg(config), content(std::move(game_content)), layout(std::move(map)), rng(seed)
{}

Player *World::find_player(std::string_view id)
{
    auto it = std::find_if(players.begin(), players.end(), [&](const Player &p) { return p.id == id; });
    return it == players.end() ? nullptr : &*it;
}

const Player *World::find_player(std::string_view id) const
{
    auto it = std::find_if(players.begin(), players.end(), [&](const Player &p) { return p.id == id; });
    return it == players.end() ? nullptr : &*it;
}

Mob *World::find_mob(std::string_view id)
{
    auto it = std::find_if(mobs.begin(), mobs.end(), [&](const Mob &m) { return m.id == id; });
    return it == mobs.end() ? nullptr : &*it;
}

Player &World::add_player(std::string id, std::string name, std::string_view class_name)
{
    const ClassDef &cls = content->class_or_default(class_name);
    Player p;
    p.id = std::move(id);
    p.name = std::move(name);
    p.class_name = cls.name;
    p.class_damage_mul = cls.damage_mul;
    p.radius = cfg.player_radius;
    p.max_hp = cfg.player_max_hp;
    p.hp = p.max_hp;
    p.base_damage = cfg.player_base_damage;
    p.base_speed = cfg.player_base_speed;
    p.attack_cooldown_ms = cfg.player_attack_cooldown_ms;
    p.pos = random_player_spawn();
    players.push_back(std::move(p));
    return players.back();
}

bool World::remove_player(std::string_view id)
{
    auto it = std::find_if(players.begin(), players.end(), [&](const Player &p) { return p.id == id; });
    if (it == players.end())
        return false;
    players.erase(it);
    return true;
}

void World::spawn_initial_mobs()
{
    for (size_t i = 0; i < content->spawn_points.size(); ++i) {
        for (const auto &[type, count] : content->spawn_points[i].mobs) {
            const MobDef *def = content->find_mob(type);
            if (!def)
                continue;
            for (uint32_t n = 0; n < count; ++n)
                mobs.push_back(make_mob(i, *def));
        }
    }
}

Mob World::make_mob(size_t spawn_index, const MobDef &def)
{
    const b2Vec2 origin = content->spawn_points[spawn_index].pos;
    const float limit = cfg.map_half - def.radius - 12.f;
    std::uniform_real_distribution<float> jitter(-cfg.mob_spawn_jitter, cfg.mob_spawn_jitter);
    b2Vec2 pos = origin;
    bool placed = false;
    for (uint32_t attempt = 0; attempt < cfg.mob_spawn_attempts && !placed; ++attempt) {
        b2Vec2 candidate{origin.x + jitter(rng), origin.y + jitter(rng)};
        if (candidate.x < -limit || candidate.x > limit || candidate.y < -limit || candidate.y > limit)
            continue;
        if (geo::point_in_any_wall(candidate, walls(), cfg.mob_wall_margin))
            continue;
        pos = candidate;
        placed = true;
    }
    if (!placed) {
        // Deterministic zig-zag away from the spawn point.
        const float step = def.radius + 20.f;
        for (int s = 0; s < 8 && geo::point_in_any_wall(pos, walls(), cfg.mob_wall_margin); ++s) {
            pos.x += (s % 2 == 0 ? 1.f : -1.f) * step * static_cast<float>(s + 1);
            pos.y += (s % 3 == 0 ? -1.f : 1.f) * step * static_cast<float>(s + 1);
        }
    }
    Mob m;
    m.id = "mob_" + std::to_string(next_mob_id++);
    m.def = &def;
    m.pos = pos;
    m.radius = def.radius;
    m.hp = def.max_hp;
    m.max_hp = def.max_hp;
    m.spawn_index = spawn_index;
    return m;
}

b2Vec2 World::random_player_spawn()
{
    const float half_extent = cfg.map_half * cfg.respawn_area_fraction;
    std::uniform_real_distribution<float> coord(-half_extent, half_extent);
    for (uint32_t i = 0; i < cfg.respawn_attempts; ++i) {
        b2Vec2 p{coord(rng), coord(rng)};
        if (!geo::point_in_any_wall(p, walls(), cfg.respawn_wall_margin))
            return p;
    }
    return b2Vec2{0.f, 0.f};
}

void World::emit(arena::ServerMessage msg)
{
    outbox.broadcast.push_back(std::move(msg));
}

void World::emit_to(const std::string &player_id, arena::ServerMessage msg)
{
    outbox.direct.emplace_back(player_id, std::move(msg));
}

std::vector<const Player *> top_players_by_kills(const World &world, size_t limit)
{
    std::vector<const Player *> out;
    out.reserve(world.players.size());
    for (const auto &p : world.players)
        out.push_back(&p);
    std::stable_sort(out.begin(), out.end(), [](const Player *a, const Player *b) { return a->kills > b->kills; });
    if (out.size() > limit)
        out.resize(limit);
    return out;
}

} // namespace arena::game
