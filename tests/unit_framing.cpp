// SPDX-License-Identifier: Apache-2.0
// Stream reassembly of length-prefixed frames.
#include "common/framing.hpp"
#include "game.pb.h"

#include <cassert>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

int main()
{
    using namespace arena::netutil;
    const std::string p1 = "hello";
    const std::string p2(100, 'x');
    const auto f1 = build_frame(p1);
    assert(f1.size() == 4 + p1.size());
    assert(f1[0] == 0 && f1[1] == 0 && f1[2] == 0 && f1[3] == 5);

    // Two frames split at every possible boundary come out whole and in order.
    std::string all = f1;
    append_frame(all, p2);
    for (size_t split = 0; split <= all.size(); ++split) {
        FrameParseState st;
        std::string out;
        std::vector<std::string> got;
        feed(st, std::string_view(all).substr(0, split));
        while (try_extract(st, out))
            got.push_back(out);
        feed(st, std::string_view(all).substr(split));
        while (try_extract(st, out))
            got.push_back(out);
        assert(got.size() == 2 && got[0] == p1 && got[1] == p2);
        assert(st.buffer.empty() && !st.invalid);
    }

    // Protocol messages survive the framing.
    arena::ClientMessage msg;
    msg.mutable_join()->set_name("alice");
    msg.mutable_join()->set_class_name("mage");
    std::string bytes;
    assert(msg.SerializeToString(&bytes));
    FrameParseState st;
    feed(st, build_frame(bytes));
    std::string payload;
    assert(try_extract(st, payload));
    arena::ClientMessage parsed;
    assert(parsed.ParseFromString(payload));
    assert(parsed.has_join() && parsed.join().name() == "alice");

    // The cap is configurable per connection.
    FrameParseState small;
    small.max_frame_bytes = 8;
    feed(small, build_frame("12345678"));
    assert(try_extract(small, payload) && payload == "12345678");
    feed(small, build_frame("123456789"));
    assert(!try_extract(small, payload));
    assert(small.invalid);
    // Nothing more is extracted once the stream is poisoned.
    feed(small, build_frame("ok"));
    assert(!try_extract(small, payload));

    std::cout << "unit_framing OK" << std::endl;
    return 0;
}
