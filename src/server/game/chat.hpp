// SPDX-License-Identifier: Apache-2.0
// chat.hpp - chat text normalisation and per-player rolling-window rate limit
#pragma once
#include "server/game/entities.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

namespace arena::game {

constexpr size_t kChatMaxChars = 240;

// Each run of CR/LF becomes one space; the result is cut to kChatMaxChars without splitting a UTF-8 sequence.
std::string sanitize_chat_text(std::string_view text);

class ChatRateLimiter
{
public:
    explicit ChatRateLimiter(uint32_t max_messages = 2, TimeMs window_ms = 1000)
        : m_max(max_messages), m_window(window_ms)
    {}

    // Records the message and returns true when fewer than max_messages were accepted in (now - window, now].
    bool allow(TimeMs now);

private:
    uint32_t m_max;
    TimeMs m_window;
    std::deque<TimeMs> m_recent;
};

} // namespace arena::game
