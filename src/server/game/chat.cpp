// SPDX-License-Identifier: Apache-2.0
#include "server/game/chat.hpp"

#include <algorithm>

namespace arena::game {

std::string sanitize_chat_text(std::string_view text)
{
    std::string out;
    out.reserve(std::min(text.size(), kChatMaxChars));
    bool in_break = false;
    for (char c : text) {
        if (c == '\r' || c == '\n') {
            if (!in_break)
                out.push_back(' ');
            in_break = true;
            continue;
        }
        in_break = false;
        out.push_back(c);
    }
    if (out.size() > kChatMaxChars) {
        size_t cut = kChatMaxChars;
        // Back off continuation bytes (10xxxxxx) so the lead byte is dropped with its tail.
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80)
            --cut;
        out.resize(cut);
    }
    return out;
}

bool ChatRateLimiter::allow(TimeMs now)
{
    while (!m_recent.empty() && now - m_recent.front() >= m_window)
        m_recent.pop_front();
    if (m_recent.size() >= m_max)
        return false;
    m_recent.push_back(now);
    return true;
}

} // namespace arena::game
