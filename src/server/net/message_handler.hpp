// SPDX-License-Identifier: Apache-2.0
// message_handler.hpp - validation and dispatch of one decoded ClientMessage.
// Handlers only stage intent (input, commands, queue membership); the owning match applies it on its tick.
#pragma once

#include "game.pb.h"
#include "server/matchmaking/session_manager.hpp"
#include "server/net/listener.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace arena::net {

constexpr size_t kMaxNameChars = 24;

enum class Disposition
{
    keep,
    close // flush pending replies, then drop the connection
};

// Removes control characters, trims surrounding blanks and caps the result at kMaxNameChars bytes
// without splitting a UTF-8 sequence. May return an empty string.
std::string sanitize_player_name(std::string_view raw);

// An empty origin is accepted; clients that do not announce one are not browsers.
bool origin_allowed(const std::vector<std::string> &allowed, std::string_view origin);

// True while the session belongs to a match in countdown or active state.
bool in_live_match(const std::shared_ptr<arena::mm::Session> &s);

Disposition handle_client_message(
    const std::shared_ptr<arena::mm::Session> &s,
    const arena::ClientMessage &msg,
    const ListenerOptions &opts);

} // namespace arena::net
