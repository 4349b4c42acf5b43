// SPDX-License-Identifier: Apache-2.0
#include "server/game/abilities.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/combat.hpp"
#include "server/game/events.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <type_traits>
#include <variant>

namespace arena::game {

namespace {

constexpr float kDegToRad = std::numbers::pi_v<float> / 180.f;
constexpr float kBurstJitterRad = 0.01f;

struct TargetRef
{
    Mob *mob{nullptr};
    Player *player{nullptr};

    explicit operator bool() const { return mob || player; }
    b2Vec2 pos() const { return mob ? mob->pos : player->pos; }
};

// Live mob or live player other than the caster.
TargetRef resolve_target(World &world, const Player &caster, const std::string &id)
{
    if (Mob *m = world.find_mob(id); m && m->alive())
        return TargetRef{m, nullptr};
    if (Player *p = world.find_player(id); p && p->alive() && p->id != caster.id)
        return TargetRef{nullptr, p};
    return {};
}

float heading_to(b2Vec2 from, b2Vec2 to)
{
    b2Vec2 d = b2Sub(to, from);
    if (b2Length(d) <= 1e-4f)
        return 0.f;
    return std::atan2(d.y, d.x);
}

// Aim point, then explicit angle, then current motion.
float aim_angle(const Player &caster, const CastRequest &req)
{
    if (req.aim)
        return heading_to(caster.pos, *req.aim);
    if (req.angle && std::isfinite(*req.angle))
        return *req.angle;
    if (b2Length(caster.vel) > 1e-4f)
        return std::atan2(caster.vel.y, caster.vel.x);
    return 0.f;
}

void spawn_projectile(
    World &world,
    const Player &caster,
    const std::string &type,
    const ProjectileSpec &spec,
    float angle,
    float damage,
    TimeMs now,
    std::optional<std::string> target_id = std::nullopt)
{
    Projectile pr;
    pr.id = "proj_" + std::to_string(world.next_projectile_id++);
    pr.owner_id = caster.id;
    pr.type = type;
    pr.pos = caster.pos;
    pr.vel = b2MulSV(spec.speed, b2Vec2{std::cos(angle), std::sin(angle)});
    pr.radius = spec.radius;
    pr.damage = damage;
    pr.expires_at = now + static_cast<TimeMs>(spec.ttl_ms);
    pr.stun_ms = spec.stun_ms;
    pr.explode_radius = spec.explode_radius;
    pr.target_id = std::move(target_id);
    world.projectiles.push_back(std::move(pr));
}

// Damages (and optionally stuns) every mob and every other player within radius of center. Returns hit count.
uint32_t area_hit(
    World &world,
    const Player &caster,
    b2Vec2 center,
    float radius,
    float damage,
    uint32_t stun_ms,
    TimeMs now)
{
    uint32_t hits = 0;
    for (auto &m : world.mobs) {
        if (!m.alive() || b2Distance(m.pos, center) > radius + m.radius)
            continue;
        ++hits;
        damage_mob(world, m, damage, caster.id, now);
        if (stun_ms > 0 && m.alive())
            stun_mob(world, m, stun_ms, caster.id, now);
    }
    for (auto &p : world.players) {
        if (p.id == caster.id || !p.alive() || b2Distance(p.pos, center) > radius + p.radius)
            continue;
        ++hits;
        apply_damage_to_player(world, p, damage, caster.id, now);
        if (stun_ms > 0 && p.alive())
            stun_player(world, p, stun_ms, caster.id, now);
    }
    return hits;
}

arena::ServerMessage base_effect(const Player &caster, const SkillDef &skill)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_cast_effect();
    ev->set_caster_id(caster.id);
    ev->set_caster_name(caster.name);
    ev->set_skill(skill.name);
    ev->set_kind(skill.kind);
    ev->set_x(wire_int(caster.pos.x));
    ev->set_y(wire_int(caster.pos.y));
    return msg;
}

void set_buff(arena::CastEffect *ev, const BuffSpec &b, float duration_mul)
{
    auto *info = ev->mutable_buff();
    info->set_stat(to_string(b.stat));
    info->set_multiplier(b.multiplier);
    info->set_duration_ms(static_cast<uint32_t>(std::lround(static_cast<float>(b.duration_ms) * duration_mul)));
}

CastResult reject(World &world, const Player &caster, uint32_t slot, const char *reason)
{
    world.emit_to(caster.id, make_cast_rejected(slot, reason));
    arena::metrics::inc(arena::metrics::runtime().casts_rejected);
    arena::log::debug("[cast] {} slot {} rejected: {}", caster.id, slot, reason);
    return CastResult{false, reason};
}

} // namespace

uint32_t clamp_slot(uint32_t slot)
{
    return std::clamp<uint32_t>(slot, 1, static_cast<uint32_t>(kSkillSlots));
}

CastResult cast_skill(World &world, Player &caster, const CastRequest &req, TimeMs now)
{
    const uint32_t slot = clamp_slot(req.slot);
    const size_t idx = slot - 1;

    if (!caster.alive())
        return reject(world, caster, slot, "dead");
    if (caster.stunned(now))
        return reject(world, caster, slot, "stunned");
    if (now < caster.cooldown_until[idx])
        return reject(world, caster, slot, "cooldown");

    const ClassDef *cls = world.content->find_class(caster.class_name);
    if (!cls)
        cls = &world.content->class_or_default(req.class_hint);
    const SkillDef &skill = cls->skills[idx];

    TargetRef target;
    if (requires_target(skill)) {
        if (!req.target_id || req.target_id->empty())
            return reject(world, caster, slot, "no_target");
        target = resolve_target(world, caster, *req.target_id);
        if (!target)
            return reject(world, caster, slot, "invalid_target");
    }

    // Cooldown is committed before any effect runs.
    caster.cooldown_until[idx] = now + static_cast<TimeMs>(skill.cooldown_ms);
    caster.expire_buffs(now);
    const float dmg_mul = caster.damage_multiplier();

    arena::ServerMessage msg = base_effect(caster, skill);
    auto *ev = msg.mutable_cast_effect();

    std::visit(
        [&](const auto &fx) {
            using T = std::decay_t<decltype(fx)>;
            if constexpr (std::is_same_v<T, MeleeSkill>) {
                const float damage = fx.damage * dmg_mul;
                ev->set_range(static_cast<uint32_t>(fx.range));
                ev->set_damage(wire_int(damage));
                Mob *best_mob = nullptr;
                float best = std::numeric_limits<float>::max();
                for (auto &m : world.mobs) {
                    float d = b2Distance(m.pos, caster.pos);
                    if (m.alive() && d <= fx.range + m.radius && d < best) {
                        best = d;
                        best_mob = &m;
                    }
                }
                if (best_mob) {
                    ev->set_target_id(best_mob->id);
                    ev->set_hits(1);
                    damage_mob(world, *best_mob, damage, caster.id, now);
                    return;
                }
                Player *best_player = nullptr;
                for (auto &p : world.players) {
                    float d = b2Distance(p.pos, caster.pos);
                    if (p.id != caster.id && p.alive() && d <= fx.range + p.radius && d < best) {
                        best = d;
                        best_player = &p;
                    }
                }
                if (best_player) {
                    ev->set_target_id(best_player->id);
                    ev->set_hits(1);
                    apply_damage_to_player(world, *best_player, damage, caster.id, now);
                }
            } else if constexpr (std::is_same_v<T, AreaSkill>) {
                const float damage = fx.damage * dmg_mul;
                ev->set_radius(static_cast<uint32_t>(fx.radius));
                ev->set_damage(wire_int(damage));
                ev->set_hits(area_hit(world, caster, caster.pos, fx.radius, damage, fx.stun_ms, now));
                if (fx.self_buff) {
                    caster.apply_buff(*fx.self_buff, now);
                    set_buff(ev, *fx.self_buff, caster.buff_duration_mul);
                }
            } else if constexpr (std::is_same_v<T, BuffSkill>) {
                caster.apply_buff(fx.buff, now);
                set_buff(ev, fx.buff, caster.buff_duration_mul);
            } else if constexpr (std::is_same_v<T, TargetProjectileSkill>) {
                const float angle = heading_to(caster.pos, target.pos());
                const std::string tid = *req.target_id;
                spawn_projectile(
                    world, caster, skill.name, fx.projectile, angle, fx.projectile.damage * dmg_mul, now, tid);
                ev->set_target_id(tid);
                ev->set_angle(angle);
                ev->set_damage(wire_int(fx.projectile.damage * dmg_mul));
                ev->set_radius(static_cast<uint32_t>(fx.projectile.explode_radius));
                ev->set_projectile_count(1);
            } else if constexpr (std::is_same_v<T, BurstSkill>) {
                const float base = aim_angle(caster, req);
                const float spread = fx.spread_deg * kDegToRad;
                std::uniform_real_distribution<float> jitter(-kBurstJitterRad, kBurstJitterRad);
                for (uint32_t n = 0; n < fx.count; ++n) {
                    float offset = 0.f;
                    if (fx.count > 1) {
                        const float mid = static_cast<float>(fx.count - 1) / 2.f;
                        offset = (static_cast<float>(n) - mid) / static_cast<float>(fx.count - 1) * spread;
                    }
                    spawn_projectile(
                        world,
                        caster,
                        skill.name,
                        fx.projectile,
                        base + offset + jitter(world.rng),
                        fx.projectile.damage * dmg_mul,
                        now);
                }
                ev->set_angle(base);
                ev->set_damage(wire_int(fx.projectile.damage * dmg_mul));
                ev->set_projectile_count(fx.count);
            } else if constexpr (std::is_same_v<T, SpreadSkill>) {
                const float base = aim_angle(caster, req);
                const float spread = fx.spread_deg * kDegToRad;
                std::uniform_real_distribution<float> unit(0.f, 1.f);
                for (uint32_t n = 0; n < fx.count; ++n) {
                    const float offset = (unit(world.rng) - 0.5f) * spread;
                    spawn_projectile(
                        world, caster, skill.name, fx.projectile, base + offset, fx.projectile.damage * dmg_mul, now);
                }
                ev->set_angle(base);
                ev->set_damage(wire_int(fx.projectile.damage * dmg_mul));
                ev->set_projectile_count(fx.count);
            } else {
                const float damage = fx.damage * dmg_mul;
                ev->set_radius(static_cast<uint32_t>(fx.radius));
                ev->set_damage(wire_int(damage));
                ev->set_hits(area_hit(world, caster, caster.pos, fx.radius, damage, 0, now));
            }
        },
        skill.effect);

    world.emit(std::move(msg));
    arena::metrics::inc(arena::metrics::runtime().casts_accepted);
    return CastResult{true, {}};
}

} // namespace arena::game
