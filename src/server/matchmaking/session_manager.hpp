// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game.pb.h"
#include "server/game/abilities.hpp"
#include "server/game/chat.hpp"

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace arena::mm {

// Commands staged by the network side and consumed by the owning match on its next tick.
struct CastCommand
{
    arena::game::CastRequest request;
};

struct ChatCommand
{
    std::string text;
    std::string chat_id;
};

using Command = std::variant<CastCommand, ChatCommand>;

// Upper bound on commands waiting for a tick; older entries are dropped first.
constexpr size_t kMaxPendingCommands = 32;

struct Session : public std::enable_shared_from_this<Session>
{
    std::string connection_id; // conn_<n>, assigned on accept
    std::string player_id; // set by join
    std::string name;
    std::string class_name;
    bool joined{false};
    bool in_queue{false};
    bool connected{true};
    std::string queue_mode;
    // Match association (set when a match adopts the session). Weak reference to avoid lifetime cycles.
    std::weak_ptr<void> match_ctx; // cast to arena::game::MatchContext in implementation to avoid circular include
    std::string match_id;
    std::chrono::steady_clock::time_point queue_join_time{};
    std::chrono::steady_clock::time_point last_heartbeat{}; // updated on any inbound frame

    struct InputState
    {
        float x{0.f};
        float y{0.f};
        uint32_t last_client_tick{0};
    } input;

    std::deque<Command> commands;
    arena::game::ChatRateLimiter chat_limiter;

    std::unique_ptr<coro::net::tcp::client> client;
    std::vector<arena::ServerMessage> outgoing; // pending outbound messages

    Session(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}
};

class SessionManager
{
public:
    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Assigns the player id (an empty name becomes Player<id>); a repeat join only refreshes name and class.
    void join(const std::shared_ptr<Session> &s, std::string name, std::string class_name);
    // Returns false when the session is already queued (for any mode).
    bool enqueue(const std::shared_ptr<Session> &s, const std::string &mode);
    // Returns false when the session was not queued.
    bool cancel_queue(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_queue(const std::string &mode);
    // 1-based position in its mode queue, 0 when not queued.
    uint32_t queue_position(const std::shared_ptr<Session> &s);
    void pop_from_queue(const std::vector<std::shared_ptr<Session>> &sessions);
    void push_message(const std::shared_ptr<Session> &s, const arena::ServerMessage &msg);
    std::vector<arena::ServerMessage> drain_messages(const std::shared_ptr<Session> &s);
    void update_heartbeat(const std::shared_ptr<Session> &s);
    void update_input(const std::shared_ptr<Session> &s, const arena::InputCommand &cmd);
    Session::InputState get_input_copy(const std::shared_ptr<Session> &s);
    void stage_command(const std::shared_ptr<Session> &s, Command cmd);
    std::vector<Command> drain_commands(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    // Joined sessions whose last inbound frame is older than cutoff.
    std::vector<std::shared_ptr<Session>> stale_sessions(std::chrono::steady_clock::time_point cutoff);
    // Match association; the context is type-erased to keep this header free of match types.
    void bind_match(const std::shared_ptr<Session> &s, std::shared_ptr<void> ctx, std::string match_id);
    // Clears the association only while it still points at ctx. Returns whether it did.
    bool release_match(const std::shared_ptr<Session> &s, const void *ctx);
    std::shared_ptr<void> match_of(const std::shared_ptr<Session> &s);
    std::shared_ptr<Session> find_by_player_id(const std::string &player_id);
    bool is_connected(const std::shared_ptr<Session> &s);
    void disconnect_session(const std::shared_ptr<Session> &s);

private:
    std::mutex m_mutex;
    uint64_t m_connection_counter{0};
    uint64_t m_player_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_connection; // pre-join
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_player; // post-join
    // FIFO queue per game mode
    std::unordered_map<std::string, std::vector<std::shared_ptr<Session>>> m_queues;
};

// Global accessor (process-wide registry)
SessionManager &instance();

} // namespace arena::mm
