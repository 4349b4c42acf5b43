// SPDX-License-Identifier: Apache-2.0
// server_config.hpp - process configuration: YAML file, then PORT / ALLOWED_ORIGINS environment overrides.
#pragma once
#include "server/game/match.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/game/world.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace arena::config {

struct ServerConfig
{
    uint16_t listen_port{8080};
    std::vector<std::string> allowed_origins;
    uint32_t tick_rate{20};
    uint32_t heartbeat_interval_seconds{5};
    uint32_t heartbeat_timeout_seconds{15};
    uint32_t matchmaker_poll_ms{1000};
    uint32_t match_create_interval_ms{5000};
    uint32_t finished_match_grace_ms{30000};
    uint32_t results_top_n{5};
    std::string content_path{"config/content.yaml"};
    std::string map_layout{"maze"};
    std::string log_level{"info"};
    bool log_json{false};
    uint16_t metrics_port{0}; // 0 disables
    std::string auto_queue_mode;
    uint32_t fixed_seed{0};
    uint32_t max_frame_bytes{1u << 20};
    std::vector<arena::game::GameMode> modes{arena::mm::default_modes()};
    arena::game::SimulationConfig simulation;
};

// Splits a comma separated list, trimming blanks and dropping empty entries.
std::vector<std::string> parse_origins(std::string_view csv);

// Throws std::runtime_error naming the key on a malformed value.
ServerConfig parse_config(const YAML::Node &root);
ServerConfig load_config(const std::string &path);

// Environment accessor so tests can inject values; nullptr reads the process environment.
using EnvLookup = const char *(*)(const char *);

// Applies PORT and ALLOWED_ORIGINS. An unparsable PORT throws std::runtime_error.
void apply_env_overrides(ServerConfig &cfg, EnvLookup env = nullptr);

// Cross-field checks (mode bounds, auto queue mode, tick rate); throws std::runtime_error.
void validate_config(const ServerConfig &cfg);

} // namespace arena::config
