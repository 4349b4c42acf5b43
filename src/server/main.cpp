// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config/server_config.hpp"
#include "server/game/content.hpp"
#include "server/game/map_layout.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/net/heartbeat.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

namespace arena {
std::atomic_bool g_shutdown{false};
} // namespace arena

static void handle_signal(int)
{
    arena::g_shutdown.store(true);
}

static std::string runtime_json(const char *metric)
{
    auto &rt = arena::metrics::runtime();
    auto &snap = arena::metrics::snapshot();
    const uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    const uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
    const uint64_t waits = rt.wait_samples.load(std::memory_order_relaxed);
    const uint64_t wait_mean_ns = waits ? rt.wait_duration_ns_accum.load(std::memory_order_relaxed) / waits : 0;
    std::ostringstream j;
    j << "{\"metric\":\"" << metric << "\"";
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"p99_tick_ns\":" << arena::metrics::approx_tick_p99();
    j << ",\"wait_mean_ns\":" << wait_mean_ns;
    j << ",\"samples\":" << samples;
    j << ",\"tick_faults\":" << rt.tick_faults.load();
    j << ",\"queue_depth\":" << rt.queue_depth.load();
    j << ",\"active_matches\":" << rt.active_matches.load();
    j << ",\"connected_players\":" << rt.connected_players.load();
    j << ",\"players_in_matches\":" << rt.players_in_matches.load();
    j << ",\"mobs_alive\":" << rt.mobs_alive.load();
    j << ",\"projectiles_active\":" << rt.projectiles_active.load();
    j << ",\"casts_rejected\":" << rt.casts_rejected.load();
    j << ",\"chat_blocked\":" << rt.chat_blocked.load();
    j << ",\"snapshot_bytes\":" << snap.bytes.load();
    j << ",\"snapshot_count\":" << snap.count.load();
    j << "}";
    return j.str();
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                arena::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                arena::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    arena::config::ServerConfig cfg;
    try {
        cfg = arena::config::load_config(config_path);
        arena::config::apply_env_overrides(cfg);
    } catch (const std::exception &ex) {
        arena::log::error("Failed to load config '{}': {}", config_path, ex.what());
        return 1;
    }
    if (cli_port_override)
        cfg.listen_port = port_override;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Explicit ARENA_LOG_* settings from the environment win over the config file.
    if (!cfg.log_level.empty() && std::getenv("ARENA_LOG_LEVEL") == nullptr)
        setenv("ARENA_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("ARENA_LOG_JSON", "1", 1);
    arena::log::init();
    arena::log::info(
        "arena server starting (version: {} sha:{} build:{})", ARENA_VERSION, ARENA_GIT_SHA, ARENA_BUILD_DATE);

    arena::mm::MatchConfig match_cfg;
    try {
        match_cfg.content = std::make_shared<const arena::game::GameContent>(
            arena::game::load_content(cfg.content_path, cfg.simulation.map_half));
    } catch (const std::exception &ex) {
        arena::log::error("Failed to load content '{}': {}", cfg.content_path, ex.what());
        return 1;
    }
    match_cfg.layout = arena::game::load_layout(cfg.map_layout, cfg.simulation.map_half);
    match_cfg.modes = cfg.modes;
    match_cfg.tick_rate = cfg.tick_rate;
    match_cfg.poll_interval_ms = cfg.matchmaker_poll_ms;
    match_cfg.create_interval_ms = cfg.match_create_interval_ms;
    match_cfg.finished_grace_ms = cfg.finished_match_grace_ms;
    match_cfg.results_top_n = cfg.results_top_n;
    match_cfg.sim = cfg.simulation;
    match_cfg.fixed_seed = cfg.fixed_seed;

    arena::net::ListenerOptions listener;
    listener.port = cfg.listen_port;
    listener.allowed_origins = cfg.allowed_origins;
    listener.auto_queue_mode = cfg.auto_queue_mode;
    listener.tick_rate = cfg.tick_rate;
    listener.max_frame_bytes = cfg.max_frame_bytes;
    listener.modes.clear();
    for (const auto &m : cfg.modes)
        listener.modes.push_back(m.name);

    arena::log::info("Tick rate: {} Hz", cfg.tick_rate);
    arena::log::info("Listening on port: {}", cfg.listen_port);
    arena::log::info(
        "Map layout: {} walls={} content classes={} mobs={}",
        match_cfg.layout.name,
        match_cfg.layout.walls.size(),
        match_cfg.content->classes.size(),
        match_cfg.content->mobs.size());
    if (cfg.allowed_origins.empty())
        arena::log::info("Origin check disabled (no allow-list)");
    else
        arena::log::info("Allowed origins: {}", cfg.allowed_origins.size());
    if (duration_override_sec > 0)
        arena::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);

    auto scheduler = coro::default_executor::io_executor();
    scheduler->spawn(arena::net::run_listener(scheduler, listener));
    scheduler->spawn(arena::mm::run_matchmaker(scheduler, match_cfg));
    scheduler->spawn(arena::net::run_heartbeat_monitor(
        scheduler, cfg.heartbeat_interval_seconds, cfg.heartbeat_timeout_seconds, arena::g_shutdown));
    if (cfg.metrics_port != 0)
        scheduler->spawn(arena::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!arena::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                arena::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                arena::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            arena::log::info("{}", runtime_json("runtime"));
        }
    }
    arena::log::info("Signal or duration shutdown, stopping.");
    arena::log::info("{}", runtime_json("runtime_final"));
    arena::log::shutdown();
    return 0;
}
