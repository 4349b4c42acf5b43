// SPDX-License-Identifier: Apache-2.0
#include "server/game/simulation.hpp"

#include "common/logger.hpp"
#include "server/game/combat.hpp"
#include "server/game/snapshot.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace arena::game {

namespace {

void move_and_collide(const World &world, b2Vec2 &pos, b2Vec2 &vel, float radius, float dt)
{
    pos = b2MulAdd(pos, dt, vel);
    pos = geo::clamp_to_map(pos, world.cfg.map_half, radius);
    geo::resolve_against_walls(pos, vel, radius, world.walls());
}

Player *nearest_live_player(World &world, b2Vec2 from, float max_dist)
{
    Player *best = nullptr;
    float best_d = std::numeric_limits<float>::max();
    for (auto &p : world.players) {
        if (!p.alive())
            continue;
        float d = b2Distance(p.pos, from);
        if (d <= max_dist && d < best_d) {
            best_d = d;
            best = &p;
        }
    }
    return best;
}

void respawn_player(World &world, Player &p, TimeMs now)
{
    p.pos = world.random_player_spawn();
    p.vel = b2Vec2{0.f, 0.f};
    p.hp = p.max_hp;
    p.invulnerable_until = now + world.cfg.respawn_invulnerability_ms;
    p.stunned_until = 0;
    p.buffs.clear();
    arena::log::debug("[match] player {} respawned at ({}, {})", p.id, p.pos.x, p.pos.y);
}

void explode(World &world, const Projectile &pr, TimeMs now)
{
    for (auto &m : world.mobs) {
        if (!m.alive() || b2Distance(m.pos, pr.pos) > pr.explode_radius + m.radius)
            continue;
        damage_mob(world, m, pr.damage, pr.owner_id, now);
        if (pr.stun_ms > 0)
            stun_mob(world, m, pr.stun_ms, pr.owner_id, now);
    }
    for (auto &p : world.players) {
        if (p.id == pr.owner_id || !p.alive() || b2Distance(p.pos, pr.pos) > pr.explode_radius + p.radius)
            continue;
        apply_damage_to_player(world, p, pr.damage, pr.owner_id, now);
        if (pr.stun_ms > 0)
            stun_player(world, p, pr.stun_ms, pr.owner_id, now);
    }
}

// Returns true when the projectile hit something and must be removed.
bool resolve_projectile_hit(World &world, const Projectile &pr, TimeMs now)
{
    Mob *mob_hit = nullptr;
    for (auto &m : world.mobs) {
        if (m.alive() && b2Distance(m.pos, pr.pos) <= pr.radius + m.radius) {
            mob_hit = &m;
            break;
        }
    }
    Player *player_hit = nullptr;
    if (!mob_hit) {
        for (auto &p : world.players) {
            if (p.id != pr.owner_id && p.alive() && b2Distance(p.pos, pr.pos) <= pr.radius + p.radius) {
                player_hit = &p;
                break;
            }
        }
    }
    if (!mob_hit && !player_hit)
        return false;
    if (pr.explode_radius > 0.f) {
        explode(world, pr, now);
        return true;
    }
    if (mob_hit) {
        damage_mob(world, *mob_hit, pr.damage, pr.owner_id, now);
        if (pr.stun_ms > 0)
            stun_mob(world, *mob_hit, pr.stun_ms, pr.owner_id, now);
    } else {
        apply_damage_to_player(world, *player_hit, pr.damage, pr.owner_id, now);
        if (pr.stun_ms > 0)
            stun_player(world, *player_hit, pr.stun_ms, pr.owner_id, now);
    }
    return true;
}

} // namespace

void respawn_mobs(World &world, TimeMs now)
{
    for (auto &m : world.mobs) {
        if (m.alive() || !m.respawn_at || now < *m.respawn_at)
            continue;
        const std::string old_id = m.id;
        m = world.make_mob(m.spawn_index, *m.def);
        arena::log::debug("[match] mob {} respawned as {}", old_id, m.id);
    }
}

void update_mobs(World &world, TimeMs now)
{
    const float dt = world.cfg.dt();
    for (auto &m : world.mobs) {
        if (!m.alive())
            continue;
        if (m.stunned(now)) {
            m.vel = b2MulSV(world.cfg.mob_stun_damping, m.vel);
            continue;
        }
        Player *target = nearest_live_player(world, m.pos, m.def->aggro_radius);
        if (!target) {
            m.vel = b2MulSV(world.cfg.mob_idle_damping, m.vel);
            move_and_collide(world, m.pos, m.vel, m.radius, dt);
            continue;
        }
        b2Vec2 to = b2Sub(target->pos, m.pos);
        m.vel = b2Length(to) > 1e-4f ? b2MulSV(m.def->speed, b2Normalize(to)) : b2Vec2{0.f, 0.f};
        move_and_collide(world, m.pos, m.vel, m.radius, dt);
        if (b2Distance(m.pos, target->pos) <= m.radius + target->radius + world.cfg.contact_pad) {
            const float dmg = m.def->atk * dt * world.cfg.mob_attack_factor;
            apply_damage_to_player(world, *target, dmg, m.id, now, false);
        }
    }
}

void update_players(World &world, TimeMs now)
{
    const float dt = world.cfg.dt();
    for (auto &p : world.players) {
        if (!p.alive()) {
            respawn_player(world, p, now);
            continue;
        }
        p.expire_buffs(now);
        if (p.stunned(now)) {
            p.vel = b2Vec2{0.f, 0.f};
            continue;
        }
        p.vel = b2MulSV(p.base_speed * p.speed_multiplier(), p.input);
        move_and_collide(world, p.pos, p.vel, p.radius, dt);

        if (now < p.next_attack_at)
            continue;
        Mob *target = nullptr;
        float best = std::numeric_limits<float>::max();
        for (auto &m : world.mobs) {
            float d = b2Distance(m.pos, p.pos);
            if (m.alive() && d <= p.radius + m.radius + world.cfg.contact_pad && d < best) {
                best = d;
                target = &m;
            }
        }
        if (target) {
            damage_mob(world, *target, p.base_damage * p.damage_multiplier(), p.id, now);
            p.next_attack_at = now + p.attack_cooldown_ms;
        }
    }
}

void update_projectiles(World &world, TimeMs now)
{
    const float dt = world.cfg.dt();
    std::vector<Projectile> survivors;
    survivors.reserve(world.projectiles.size());
    // Hits may not spawn projectiles, so iterating a moved-out list is safe.
    std::vector<Projectile> current = std::move(world.projectiles);
    world.projectiles.clear();
    for (auto &pr : current) {
        if (now >= pr.expires_at)
            continue;
        pr.pos = b2MulAdd(pr.pos, dt, pr.vel);
        pr.pos = geo::clamp_to_map(pr.pos, world.cfg.map_half, pr.radius);
        if (resolve_projectile_hit(world, pr, now))
            continue;
        survivors.push_back(std::move(pr));
    }
    world.projectiles = std::move(survivors);
}

void step_world(World &world, TimeMs now)
{
    respawn_mobs(world, now);
    update_mobs(world, now);
    update_players(world, now);
    update_projectiles(world, now);
}

void tick(World &world, TimeMs now)
{
    step_world(world, now);
    ++world.server_tick;
    arena::ServerMessage msg;
    *msg.mutable_snapshot() = build_snapshot(world, now, world.cfg.snapshot_walls);
    world.emit(std::move(msg));
}

void passive_heal(World &world, TimeMs now)
{
    if (now - world.last_heal_at < world.cfg.passive_heal_interval_ms)
        return;
    world.last_heal_at = now;
    for (auto &p : world.players)
        heal_player(world, p, world.cfg.passive_heal_amount);
}

} // namespace arena::game
