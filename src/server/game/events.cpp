// SPDX-License-Identifier: Apache-2.0
#include "server/game/events.hpp"

#include "server/game/world.hpp"

#include <algorithm>
#include <cmath>

namespace arena::game {

namespace {

void fill_roster(google::protobuf::RepeatedPtrField<arena::RosterEntry> *out, const Roster &roster)
{
    for (const auto &[id, name] : roster) {
        auto *e = out->Add();
        e->set_id(id);
        e->set_name(name);
    }
}

} // namespace

int32_t wire_int(float v)
{
    return static_cast<int32_t>(std::lround(v));
}

arena::ServerMessage make_mob_hurt(const Mob &mob, float damage, std::string_view source_id)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_mob_hurt();
    ev->set_mob_id(mob.id);
    ev->set_hp(wire_int(std::max(0.f, mob.hp)));
    ev->set_damage(wire_int(damage));
    ev->set_source_id(std::string(source_id));
    return msg;
}

arena::ServerMessage make_mob_died(const Mob &mob, std::string_view killer_id, uint32_t gold, uint32_t xp)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_mob_died();
    ev->set_mob_id(mob.id);
    ev->set_mob_type(mob.type());
    ev->set_killer_id(std::string(killer_id));
    ev->set_gold(gold);
    ev->set_xp(xp);
    return msg;
}

arena::ServerMessage make_player_hurt(const Player &p, float damage, std::string_view source_id)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_player_hurt();
    ev->set_player_id(p.id);
    ev->set_hp(wire_int(p.hp));
    ev->set_damage(wire_int(damage));
    ev->set_source_id(std::string(source_id));
    return msg;
}

arena::ServerMessage make_player_died(const Player &p, std::string_view killer_id, uint64_t gold_lost)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_player_died();
    ev->set_player_id(p.id);
    ev->set_killer_id(std::string(killer_id));
    ev->set_gold_lost(gold_lost);
    return msg;
}

arena::ServerMessage make_player_healed(const Player &p, float amount)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_player_healed();
    ev->set_player_id(p.id);
    ev->set_hp(wire_int(p.hp));
    ev->set_amount(wire_int(amount));
    return msg;
}

arena::ServerMessage make_stun(
    std::string_view target_id,
    std::string_view kind,
    TimeMs until,
    std::string_view source_id)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_stun();
    ev->set_target_id(std::string(target_id));
    ev->set_kind(std::string(kind));
    ev->set_until(until);
    ev->set_source_id(std::string(source_id));
    return msg;
}

arena::ServerMessage make_cast_rejected(uint32_t slot, std::string_view reason)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_cast_rejected();
    ev->set_slot(slot);
    ev->set_reason(std::string(reason));
    return msg;
}

arena::ServerMessage make_level_up(const Player &p, uint32_t level_ups, float hp_gain)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_player_levelup();
    ev->set_player_id(p.id);
    ev->set_player_name(p.name);
    ev->set_level(p.level);
    ev->set_level_ups(level_ups);
    ev->set_hp_gain(wire_int(hp_gain));
    ev->set_new_hp(wire_int(p.hp));
    ev->set_new_max_hp(wire_int(p.max_hp));
    ev->set_xp(p.xp);
    ev->set_next_level_xp(p.next_level_xp);
    ev->set_damage_mul(p.damage_mul);
    ev->set_buff_duration_mul(p.buff_duration_mul);
    return msg;
}

arena::ServerMessage make_leaderboard_update(const World &world)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_leaderboard_update();
    for (const Player *p : top_players_by_kills(world, world.cfg.leaderboard_size)) {
        auto *e = ev->add_entries();
        e->set_player_id(p->id);
        e->set_player_name(p->name);
        e->set_kills(p->kills);
    }
    return msg;
}

arena::ServerMessage make_chat(const Player &p, std::string text, TimeMs ts, std::string chat_id)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_chat();
    ev->set_player_id(p.id);
    ev->set_name(p.name);
    ev->set_text(std::move(text));
    ev->set_ts(ts);
    ev->set_chat_id(std::move(chat_id));
    return msg;
}

arena::ServerMessage make_chat_blocked(std::string_view reason, TimeMs ts)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_chat_blocked();
    ev->set_reason(std::string(reason));
    ev->set_ts(ts);
    return msg;
}

arena::ServerMessage make_joined(std::string_view player_id, std::string_view name)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_joined();
    ev->set_player_id(std::string(player_id));
    ev->set_name(std::string(name));
    return msg;
}

arena::ServerMessage make_queue_update(std::string_view mode, const Roster &queued, uint32_t position)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_queue_update();
    ev->set_mode(std::string(mode));
    fill_roster(ev->mutable_players(), queued);
    ev->set_position(position);
    return msg;
}

arena::ServerMessage make_match_created(
    std::string_view match_id,
    std::string_view mode,
    uint32_t countdown_ms,
    const Roster &roster)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_match_created();
    ev->set_match_id(std::string(match_id));
    ev->set_mode(std::string(mode));
    ev->set_countdown_ms(countdown_ms);
    fill_roster(ev->mutable_players(), roster);
    return msg;
}

arena::ServerMessage make_match_countdown(std::string_view match_id, uint32_t remaining_ms, const Roster &roster)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_match_countdown();
    ev->set_match_id(std::string(match_id));
    ev->set_remaining_ms(remaining_ms);
    fill_roster(ev->mutable_players(), roster);
    return msg;
}

arena::ServerMessage make_match_start(
    std::string_view match_id,
    std::string_view mode,
    float map_half,
    uint32_t duration_ms,
    std::span<const geo::Wall> walls,
    const Roster &roster)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_match_start();
    ev->set_match_id(std::string(match_id));
    ev->set_mode(std::string(mode));
    ev->set_map_half(static_cast<uint32_t>(map_half));
    ev->set_duration_ms(duration_ms);
    for (const auto &w : walls)
        fill_wall(ev->add_walls(), w);
    fill_roster(ev->mutable_players(), roster);
    return msg;
}

arena::ServerMessage make_match_cancelled(std::string_view match_id, std::string_view reason, std::string message)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_match_cancelled();
    ev->set_match_id(std::string(match_id));
    ev->set_reason(std::string(reason));
    ev->set_message(std::move(message));
    return msg;
}

arena::ServerMessage make_match_finished(std::string_view match_id, const World &world, size_t top_n)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_match_finished();
    ev->set_match_id(std::string(match_id));
    for (const Player *p : top_players_by_kills(world, top_n)) {
        auto *r = ev->add_results();
        r->set_player_id(p->id);
        r->set_name(p->name);
        r->set_kills(p->kills);
    }
    return msg;
}

arena::ServerMessage make_error(std::string_view reason, std::string message)
{
    arena::ServerMessage msg;
    auto *ev = msg.mutable_error();
    ev->set_reason(std::string(reason));
    ev->set_message(std::move(message));
    return msg;
}

arena::ServerMessage make_ping(uint64_t ts)
{
    arena::ServerMessage msg;
    msg.mutable_ping()->set_ts(ts);
    return msg;
}

arena::ServerMessage make_pong(uint64_t ts)
{
    arena::ServerMessage msg;
    msg.mutable_pong()->set_ts(ts);
    return msg;
}

void fill_wall(arena::Wall *out, const geo::Wall &wall)
{
    if (const auto *r = std::get_if<geo::RectWall>(&wall)) {
        auto *rect = out->mutable_rect();
        rect->set_id(r->id);
        rect->set_x(wire_int(r->x));
        rect->set_y(wire_int(r->y));
        rect->set_w(wire_int(r->w));
        rect->set_h(wire_int(r->h));
        return;
    }
    const auto &poly = std::get<geo::PolygonWall>(wall);
    auto *pw = out->mutable_polygon();
    pw->set_id(poly.id);
    for (const auto &pt : poly.points) {
        auto *v = pw->add_points();
        v->set_x(wire_int(pt.x));
        v->set_y(wire_int(pt.y));
    }
}

} // namespace arena::game
