// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game.pb.h"
#include "server/matchmaking/session_manager.hpp"

#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace arena::test {

// Registered session over an unconnected client; only the bookkeeping is exercised.
inline std::shared_ptr<arena::mm::Session> make_session(const std::shared_ptr<coro::io_scheduler> &scheduler)
{
    coro::net::tcp::client dummy{scheduler};
    return arena::mm::instance().add_connection(std::move(dummy));
}

inline std::shared_ptr<arena::mm::Session> make_joined_session(
    const std::shared_ptr<coro::io_scheduler> &scheduler,
    std::string name,
    std::string class_name = "warrior")
{
    auto s = make_session(scheduler);
    arena::mm::instance().join(s, std::move(name), std::move(class_name));
    return s;
}

inline size_t count_kind(const std::vector<arena::ServerMessage> &msgs, arena::ServerMessage::PayloadCase kind)
{
    return static_cast<size_t>(std::count_if(msgs.begin(), msgs.end(), [&](const arena::ServerMessage &m) {
        return m.payload_case() == kind;
    }));
}

inline const arena::ServerMessage *last_of(
    const std::vector<arena::ServerMessage> &msgs,
    arena::ServerMessage::PayloadCase kind)
{
    for (auto it = msgs.rbegin(); it != msgs.rend(); ++it)
        if (it->payload_case() == kind)
            return &*it;
    return nullptr;
}

} // namespace arena::test
