// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <iterator>

namespace arena::mm {

SessionManager &instance()
{
    static SessionManager inst;
    return inst;
}

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid, std::move(client));
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

void SessionManager::join(const std::shared_ptr<Session> &s, std::string name, std::string class_name)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
    // Name and class are fixed at the first join; match and matchmaker tasks read them unlocked.
    if (s->joined)
        return;
    s->class_name = std::move(class_name);
    s->name = std::move(name);
    s->joined = true;
    s->player_id = std::to_string(++m_player_counter);
    if (s->name.empty())
        s->name = "Player" + s->player_id;
    m_by_player[s->player_id] = s;
    arena::metrics::inc(arena::metrics::runtime().connected_players);
}

bool SessionManager::enqueue(const std::shared_ptr<Session> &s, const std::string &mode)
{
    std::scoped_lock lk{m_mutex};
    if (s->in_queue)
        return false;
    s->in_queue = true;
    s->queue_mode = mode;
    s->queue_join_time = std::chrono::steady_clock::now();
    m_queues[mode].push_back(s);
    arena::metrics::inc(arena::metrics::runtime().queue_depth);
    return true;
}

bool SessionManager::cancel_queue(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (!s->in_queue)
        return false;
    auto &q = m_queues[s->queue_mode];
    q.erase(std::remove(q.begin(), q.end(), s), q.end());
    s->in_queue = false;
    s->queue_mode.clear();
    arena::metrics::dec(arena::metrics::runtime().queue_depth);
    return true;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_queue(const std::string &mode)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_queues.find(mode);
    if (it == m_queues.end())
        return {};
    return it->second;
}

uint32_t SessionManager::queue_position(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (!s->in_queue)
        return 0;
    auto &q = m_queues[s->queue_mode];
    auto it = std::find(q.begin(), q.end(), s);
    return it == q.end() ? 0 : static_cast<uint32_t>(it - q.begin()) + 1;
}

void SessionManager::pop_from_queue(const std::vector<std::shared_ptr<Session>> &sessions)
{
    std::scoped_lock lk{m_mutex};
    for (auto &s : sessions) {
        if (!s->in_queue)
            continue;
        auto &q = m_queues[s->queue_mode];
        q.erase(std::remove(q.begin(), q.end(), s), q.end());
        s->in_queue = false;
        s->queue_mode.clear();
        arena::metrics::dec(arena::metrics::runtime().queue_depth);
    }
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, const arena::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (!s->connected)
        return;
    s->outgoing.push_back(msg);
}

std::vector<arena::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<arena::ServerMessage> out;
    out.swap(s->outgoing);
    return out;
}

void SessionManager::update_heartbeat(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
}

void SessionManager::update_input(const std::shared_ptr<Session> &s, const arena::InputCommand &cmd)
{
    std::scoped_lock lk{m_mutex};
    if (cmd.client_tick() != 0 && cmd.client_tick() < s->input.last_client_tick)
        return; // ignore old
    b2Vec2 v = arena::game::sanitize_input(cmd.x(), cmd.y());
    bool changed = s->input.x != v.x || s->input.y != v.y;
    s->input.last_client_tick = cmd.client_tick();
    s->input.x = v.x;
    s->input.y = v.y;
    if (changed)
        arena::log::debug("[input] player={} ctick={} x={} y={}", s->player_id, cmd.client_tick(), v.x, v.y);
}

Session::InputState SessionManager::get_input_copy(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->input;
}

void SessionManager::stage_command(const std::shared_ptr<Session> &s, Command cmd)
{
    std::scoped_lock lk{m_mutex};
    if (s->commands.size() >= kMaxPendingCommands)
        s->commands.pop_front();
    s->commands.push_back(std::move(cmd));
}

std::vector<Command> SessionManager::drain_commands(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<Command> out(
        std::make_move_iterator(s->commands.begin()), std::make_move_iterator(s->commands.end()));
    s->commands.clear();
    return out;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_player.size());
    for (auto &kv : m_by_player)
        res.push_back(kv.second);
    return res;
}

void SessionManager::bind_match(const std::shared_ptr<Session> &s, std::shared_ptr<void> ctx, std::string match_id)
{
    std::scoped_lock lk{m_mutex};
    s->match_ctx = ctx;
    s->match_id = std::move(match_id);
}

bool SessionManager::release_match(const std::shared_ptr<Session> &s, const void *ctx)
{
    std::scoped_lock lk{m_mutex};
    if (s->match_ctx.lock().get() != ctx)
        return false;
    s->match_ctx.reset();
    s->match_id.clear();
    return true;
}

std::shared_ptr<void> SessionManager::match_of(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->match_ctx.lock();
}

std::vector<std::shared_ptr<Session>> SessionManager::stale_sessions(std::chrono::steady_clock::time_point cutoff)
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    for (auto &kv : m_by_player) {
        if (kv.second->last_heartbeat < cutoff)
            res.push_back(kv.second);
    }
    return res;
}

std::shared_ptr<Session> SessionManager::find_by_player_id(const std::string &player_id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_player.find(player_id);
    return it == m_by_player.end() ? nullptr : it->second;
}

bool SessionManager::is_connected(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->connected;
}

void SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (!s->connected)
        return;
    s->connected = false;
    if (s->in_queue) {
        auto &q = m_queues[s->queue_mode];
        q.erase(std::remove(q.begin(), q.end(), s), q.end());
        s->in_queue = false;
        arena::metrics::dec(arena::metrics::runtime().queue_depth);
    }
    s->outgoing.clear();
    s->commands.clear();
    if (!s->player_id.empty())
        m_by_player.erase(s->player_id);
    m_by_connection.erase(s->connection_id);
    if (s->joined)
        arena::metrics::dec(arena::metrics::runtime().connected_players);
}

} // namespace arena::mm
