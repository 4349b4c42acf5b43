// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/framing.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace arena::net {

struct ListenerOptions
{
    uint16_t port{8080};
    // Empty list accepts every origin.
    std::vector<std::string> allowed_origins;
    // Queue mode applied right after join; empty disables auto queueing.
    std::string auto_queue_mode;
    // Mode names accepted by queue_join.
    std::vector<std::string> modes{"ffa", "world"};
    uint32_t tick_rate{20};
    uint32_t max_frame_bytes{arena::netutil::kDefaultMaxFrameBytes};
};

// Starts the TCP accept loop on opts.port.
// poll/read timeout inside each connection loop is derived from tick_rate to
// keep outbound flush latency bounded relative to simulation ticks.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, ListenerOptions opts);

} // namespace arena::net
