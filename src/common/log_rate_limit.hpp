// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite sampling for hot paths (mob AI, projectile sweeps): only every Nth call formats and logs.
// Usage: ARENA_LOG_EVERY_N(debug, 100, "[match] tick={} mobs={}", tick, count);
#define ARENA_LOG_EVERY_N(lvl, N, ...) \
    do { \
        static std::atomic<uint64_t> arena_log_every_n_counter{0}; \
        if ((arena_log_every_n_counter.fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) \
            ::arena::log::lvl(__VA_ARGS__); \
    } while (0)
