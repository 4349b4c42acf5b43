// SPDX-License-Identifier: Apache-2.0
#include "server/net/message_handler.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/events.hpp"
#include "server/game/match.hpp"

#include <algorithm>

namespace arena::net {

namespace {

using SessionPtr = std::shared_ptr<arena::mm::Session>;

std::shared_ptr<arena::game::MatchContext> bound_match(const SessionPtr &s)
{
    return std::static_pointer_cast<arena::game::MatchContext>(arena::mm::instance().match_of(s));
}

void send_queue_update(const SessionPtr &s, const std::string &mode)
{
    auto &mgr = arena::mm::instance();
    arena::game::Roster roster;
    for (auto &q : mgr.snapshot_queue(mode))
        roster.emplace_back(q->player_id, q->name);
    mgr.push_message(s, arena::game::make_queue_update(mode, roster, mgr.queue_position(s)));
}

void join_queue(const SessionPtr &s, const std::string &mode)
{
    if (arena::mm::instance().enqueue(s, mode))
        arena::log::info("[conn] queued player={} mode={}", s->player_id, mode);
    send_queue_update(s, mode);
}

void reply_error(const SessionPtr &s, std::string_view reason, std::string message)
{
    arena::mm::instance().push_message(s, arena::game::make_error(reason, std::move(message)));
}

Disposition on_join(const SessionPtr &s, const arena::JoinRequest &req, const ListenerOptions &opts)
{
    auto &mgr = arena::mm::instance();
    if (!origin_allowed(opts.allowed_origins, req.origin())) {
        arena::log::warn("[conn] origin rejected conn={} origin={}", s->connection_id, req.origin());
        reply_error(s, "origin_not_allowed", "Origin not allowed");
        return Disposition::close;
    }
    mgr.join(s, sanitize_player_name(req.name()), req.class_name());
    mgr.push_message(s, arena::game::make_joined(s->player_id, s->name));
    arena::log::info("[conn] joined conn={} player={} name={}", s->connection_id, s->player_id, s->name);
    if (!opts.auto_queue_mode.empty() && !in_live_match(s))
        join_queue(s, opts.auto_queue_mode);
    return Disposition::keep;
}

void on_queue_join(const SessionPtr &s, const arena::QueueJoin &req, const ListenerOptions &opts)
{
    const std::string &mode = req.mode();
    if (std::find(opts.modes.begin(), opts.modes.end(), mode) == opts.modes.end()) {
        reply_error(s, "invalid_mode", "Unknown game mode: " + mode);
        return;
    }
    if (in_live_match(s)) {
        reply_error(s, "already_in_match", "Already in a match");
        return;
    }
    join_queue(s, mode);
}

arena::game::CastRequest to_cast_request(const arena::CastRequest &msg)
{
    arena::game::CastRequest req;
    req.slot = msg.slot();
    req.class_hint = msg.class_hint();
    if (msg.has_target_id() && !msg.target_id().empty())
        req.target_id = msg.target_id();
    if (msg.has_angle())
        req.angle = msg.angle();
    if (msg.has_aim_x() && msg.has_aim_y())
        req.aim = b2Vec2{msg.aim_x(), msg.aim_y()};
    return req;
}

bool require_active_match(const SessionPtr &s)
{
    auto ctx = bound_match(s);
    if (ctx && ctx->current_state() == arena::game::MatchState::active)
        return true;
    reply_error(s, "not_in_match", "Not in an active match");
    return false;
}

} // namespace

std::string sanitize_player_name(std::string_view raw)
{
    std::string out;
    out.reserve(std::min(raw.size(), kMaxNameChars + 4));
    for (char c : raw) {
        auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F)
            continue;
        out.push_back(c);
    }
    auto first = out.find_first_not_of(' ');
    if (first == std::string::npos)
        return {};
    out.erase(0, first);
    out.erase(out.find_last_not_of(' ') + 1);
    if (out.size() > kMaxNameChars) {
        size_t cut = kMaxNameChars;
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80)
            --cut;
        out.resize(cut);
        out.erase(out.find_last_not_of(' ') + 1);
    }
    return out;
}

bool origin_allowed(const std::vector<std::string> &allowed, std::string_view origin)
{
    if (allowed.empty() || origin.empty())
        return true;
    return std::find(allowed.begin(), allowed.end(), origin) != allowed.end();
}

bool in_live_match(const std::shared_ptr<arena::mm::Session> &s)
{
    auto ctx = bound_match(s);
    if (!ctx)
        return false;
    auto st = ctx->current_state();
    return st == arena::game::MatchState::countdown || st == arena::game::MatchState::active;
}

Disposition handle_client_message(
    const std::shared_ptr<arena::mm::Session> &s,
    const arena::ClientMessage &msg,
    const ListenerOptions &opts)
{
    auto &mgr = arena::mm::instance();
    if (msg.payload_case() == arena::ClientMessage::PAYLOAD_NOT_SET) {
        arena::metrics::inc(arena::metrics::runtime().malformed_messages);
        return Disposition::keep;
    }
    if (msg.has_join())
        return on_join(s, msg.join(), opts);
    if (!s->joined) {
        reply_error(s, "need_join", "Send join first");
        return Disposition::keep;
    }
    switch (msg.payload_case()) {
        case arena::ClientMessage::kQueueJoin:
            on_queue_join(s, msg.queue_join(), opts);
            break;
        case arena::ClientMessage::kQueueCancel:
            if (mgr.cancel_queue(s))
                arena::log::info("[conn] queue cancelled player={}", s->player_id);
            break;
        case arena::ClientMessage::kInput:
            mgr.update_input(s, msg.input());
            break;
        case arena::ClientMessage::kCast:
            if (require_active_match(s))
                mgr.stage_command(s, arena::mm::CastCommand{to_cast_request(msg.cast())});
            break;
        case arena::ClientMessage::kChat:
            if (require_active_match(s))
                mgr.stage_command(s, arena::mm::ChatCommand{msg.chat().text(), msg.chat().chat_id()});
            break;
        case arena::ClientMessage::kPing:
            mgr.push_message(s, arena::game::make_pong(msg.ping().ts()));
            break;
        case arena::ClientMessage::kPong:
            // heartbeat already refreshed by the connection loop
            break;
        default:
            break;
    }
    return Disposition::keep;
}

} // namespace arena::net
