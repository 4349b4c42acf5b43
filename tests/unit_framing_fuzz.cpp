// SPDX-License-Identifier: Apache-2.0
// unit_framing_fuzz.cpp
// Fuzz-style checks for the frame parser: malformed lengths, truncations, random noise.
#include "common/framing.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cassert>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using arena::netutil::FrameParseState;

static size_t feed_bytes(FrameParseState &st, const std::string &data, size_t chunk, const std::string *expect)
{
    std::string out;
    size_t frames = 0;
    for (size_t i = 0; i < data.size();) {
        size_t n = std::min(chunk, data.size() - i);
        arena::netutil::feed(st, std::string_view(data).substr(i, n));
        i += n;
        while (arena::netutil::try_extract(st, out)) {
            assert(!out.empty());
            if (expect)
                assert(out == *expect);
            ++frames;
        }
    }
    return frames;
}

static uint32_t rnd32(std::mt19937 &rng)
{
    return std::uniform_int_distribution<uint32_t>{0, 0xffffffff}(rng);
}

static FrameParseState with_header(uint32_t len)
{
    FrameParseState st;
    uint32_t net = htonl(len);
    st.buffer.resize(4);
    std::memcpy(st.buffer.data(), &net, 4);
    return st;
}

int main()
{
    std::mt19937 rng(12345);
    // 1. Valid random payloads with varied chunk sizes
    for (int case_id = 0; case_id < 200; ++case_id) {
        size_t len = std::uniform_int_distribution<size_t>{1, 2048}(rng);
        std::string payload(len, '\0');
        for (auto &c : payload)
            c = static_cast<char>(rnd32(rng));
        auto frame = arena::netutil::build_frame(payload);
        FrameParseState st;
        assert(feed_bytes(st, frame, (case_id % 17) + 1, &payload) == 1);
        assert(st.buffer.empty());
    }
    // 2. Truncated frames never yield output
    for (int case_id = 0; case_id < 100; ++case_id) {
        size_t len = std::uniform_int_distribution<size_t>{10, 4096}(rng);
        std::string payload(len, 'x');
        auto frame = arena::netutil::build_frame(payload);
        frame.resize(frame.size() - std::uniform_int_distribution<size_t>{1, len}(rng));
        FrameParseState st;
        std::string out;
        st.buffer.assign(frame.begin(), frame.end());
        assert(!arena::netutil::try_extract(st, out));
        assert(!st.invalid);
    }
    // 3. Oversized length poisons the stream
    {
        auto st = with_header(50'000'000);
        std::string out;
        assert(!arena::netutil::try_extract(st, out));
        assert(st.invalid);
    }
    // 4. Zero length is rejected too
    {
        auto st = with_header(0);
        std::string out;
        assert(!arena::netutil::try_extract(st, out));
        assert(st.invalid);
    }
    // 5. Random noise either parses into bounded frames or marks the stream invalid; it never crashes
    for (int case_id = 0; case_id < 200; ++case_id) {
        std::string noise(std::uniform_int_distribution<size_t>{1, 512}(rng), '\0');
        for (auto &c : noise)
            c = static_cast<char>(rnd32(rng));
        FrameParseState st;
        st.max_frame_bytes = 256;
        feed_bytes(st, noise, (case_id % 7) + 1, nullptr);
        assert(st.invalid || st.buffer.size() < 4 + st.max_frame_bytes);
    }
    std::cout << "unit_framing_fuzz OK" << std::endl;
    return 0;
}
