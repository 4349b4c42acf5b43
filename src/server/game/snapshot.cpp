// SPDX-License-Identifier: Apache-2.0
#include "server/game/snapshot.hpp"

#include "server/game/events.hpp"

#include <algorithm>

namespace arena::game {

arena::Snapshot build_snapshot(const World &world, TimeMs now, bool include_walls)
{
    arena::Snapshot snap;
    snap.set_server_tick(world.server_tick);
    snap.set_time_ms(now);
    for (const auto &p : world.players) {
        if (!p.alive() && !world.cfg.include_dead_players)
            continue;
        auto *ps = snap.add_players();
        ps->set_id(p.id);
        ps->set_name(p.name);
        ps->set_class_name(p.class_name);
        ps->set_x(wire_int(p.pos.x));
        ps->set_y(wire_int(p.pos.y));
        ps->set_vx(wire_int(p.vel.x));
        ps->set_vy(wire_int(p.vel.y));
        ps->set_radius(static_cast<uint32_t>(wire_int(p.radius)));
        ps->set_hp(wire_int(std::clamp(p.hp, 0.f, p.max_hp)));
        ps->set_max_hp(wire_int(p.max_hp));
        ps->set_level(p.level);
        ps->set_xp(p.xp);
        ps->set_next_level_xp(p.next_level_xp);
        ps->set_kills(p.kills);
        ps->set_deaths(p.deaths);
        ps->set_gold(p.gold);
        ps->set_stunned(p.stunned(now));
        ps->set_invulnerable(p.invulnerable(now));
    }
    for (const auto &m : world.mobs) {
        if (!m.alive())
            continue;
        auto *ms = snap.add_mobs();
        ms->set_id(m.id);
        ms->set_type(m.type());
        ms->set_x(wire_int(m.pos.x));
        ms->set_y(wire_int(m.pos.y));
        ms->set_hp(wire_int(m.hp));
        ms->set_max_hp(wire_int(m.max_hp));
        ms->set_radius(static_cast<uint32_t>(wire_int(m.radius)));
        ms->set_stunned_until(m.stunned_until > now ? m.stunned_until : 0);
    }
    for (const auto &pr : world.projectiles) {
        auto *s = snap.add_projectiles();
        s->set_id(pr.id);
        s->set_type(pr.type);
        s->set_x(wire_int(pr.pos.x));
        s->set_y(wire_int(pr.pos.y));
        s->set_vx(wire_int(pr.vel.x));
        s->set_vy(wire_int(pr.vel.y));
        s->set_radius(static_cast<uint32_t>(wire_int(pr.radius)));
        s->set_owner_id(pr.owner_id);
        s->set_ttl_ms(static_cast<uint32_t>(std::max<TimeMs>(0, pr.expires_at - now)));
    }
    if (include_walls) {
        for (const auto &w : world.walls())
            fill_wall(snap.add_walls(), w);
    }
    for (const Player *p : top_players_by_kills(world, world.cfg.leaderboard_size)) {
        auto *e = snap.add_leaderboard();
        e->set_player_id(p->id);
        e->set_player_name(p->name);
        e->set_kills(p->kills);
    }
    return snap;
}

arena::ServerMessage make_welcome(const World &world, const Player &player, std::string_view match_id)
{
    arena::ServerMessage msg;
    auto *w = msg.mutable_welcome();
    w->set_player_id(player.id);
    w->set_match_id(std::string(match_id));
    w->set_map_half(static_cast<uint32_t>(world.cfg.map_half));
    w->set_tick_rate(world.cfg.tick_rate);
    for (const auto &wall : world.walls())
        fill_wall(w->add_walls(), wall);
    w->mutable_spawn()->set_x(wire_int(player.pos.x));
    w->mutable_spawn()->set_y(wire_int(player.pos.y));
    return msg;
}

} // namespace arena::game
