// SPDX-License-Identifier: Apache-2.0
#include "server/config/server_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace arena::config {

namespace {

// Reads root[key] into out when present. Conversion failures are rethrown naming the key.
template <typename T>
void read_key(const YAML::Node &root, const char *key, T &out)
{
    const YAML::Node node = root[key];
    if (!node)
        return;
    try {
        out = node.as<T>();
    } catch (const YAML::Exception &e) {
        throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
    }
}

void read_ms(const YAML::Node &root, const char *key, arena::game::TimeMs &out)
{
    int64_t v = out;
    read_key(root, key, v);
    out = v;
}

std::string trim(std::string_view s)
{
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

arena::game::GameMode parse_mode(const YAML::Node &node)
{
    arena::game::GameMode m;
    read_key(node, "name", m.name);
    read_key(node, "min_players", m.min_players);
    read_key(node, "max_players", m.max_players);
    read_key(node, "countdown_ms", m.countdown_ms);
    read_key(node, "duration_ms", m.duration_ms);
    read_key(node, "persistent", m.persistent);
    return m;
}

void parse_simulation(const YAML::Node &node, arena::game::SimulationConfig &sim)
{
    read_key(node, "map_half", sim.map_half);
    read_key(node, "player_radius", sim.player_radius);
    read_key(node, "player_max_hp", sim.player_max_hp);
    read_key(node, "player_base_damage", sim.player_base_damage);
    read_key(node, "player_base_speed", sim.player_base_speed);
    read_ms(node, "player_attack_cooldown_ms", sim.player_attack_cooldown_ms);
    read_ms(node, "respawn_invulnerability_ms", sim.respawn_invulnerability_ms);
    read_key(node, "respawn_attempts", sim.respawn_attempts);
    read_key(node, "respawn_area_fraction", sim.respawn_area_fraction);
    read_key(node, "respawn_wall_margin", sim.respawn_wall_margin);
    read_key(node, "mob_spawn_jitter", sim.mob_spawn_jitter);
    read_key(node, "mob_spawn_attempts", sim.mob_spawn_attempts);
    read_key(node, "mob_wall_margin", sim.mob_wall_margin);
    read_key(node, "contact_pad", sim.contact_pad);
    read_key(node, "mob_attack_factor", sim.mob_attack_factor);
    read_key(node, "mob_idle_damping", sim.mob_idle_damping);
    read_key(node, "mob_stun_damping", sim.mob_stun_damping);
    read_key(node, "gold_steal_fraction", sim.gold_steal_fraction);
    read_key(node, "level_hp_bonus", sim.level_hp_bonus);
    read_key(node, "level_xp_growth", sim.level_xp_growth);
    read_key(node, "leaderboard_size", sim.leaderboard_size);
    read_key(node, "include_dead_players", sim.include_dead_players);
    read_key(node, "snapshot_walls", sim.snapshot_walls);
}

} // namespace

std::vector<std::string> parse_origins(std::string_view csv)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string_view::npos)
            comma = csv.size();
        std::string entry = trim(csv.substr(start, comma - start));
        if (!entry.empty())
            out.push_back(std::move(entry));
        start = comma + 1;
    }
    return out;
}

ServerConfig parse_config(const YAML::Node &root)
{
    ServerConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw std::runtime_error("config root must be a map");
    read_key(root, "listen_port", cfg.listen_port);
    if (const YAML::Node origins = root["allowed_origins"]) {
        if (origins.IsSequence()) {
            cfg.allowed_origins.clear();
            for (const auto &o : origins) {
                std::string entry = trim(o.as<std::string>());
                if (!entry.empty())
                    cfg.allowed_origins.push_back(std::move(entry));
            }
        } else if (origins.IsScalar()) {
            cfg.allowed_origins = parse_origins(origins.as<std::string>());
        } else {
            throw std::runtime_error("config key 'allowed_origins': expected list or comma separated string");
        }
    }
    read_key(root, "tick_rate", cfg.tick_rate);
    read_key(root, "heartbeat_interval_seconds", cfg.heartbeat_interval_seconds);
    read_key(root, "heartbeat_timeout_seconds", cfg.heartbeat_timeout_seconds);
    read_key(root, "matchmaker_poll_ms", cfg.matchmaker_poll_ms);
    read_key(root, "match_create_interval_ms", cfg.match_create_interval_ms);
    read_key(root, "finished_match_grace_ms", cfg.finished_match_grace_ms);
    read_key(root, "results_top_n", cfg.results_top_n);
    read_ms(root, "passive_heal_interval_ms", cfg.simulation.passive_heal_interval_ms);
    read_key(root, "passive_heal_amount", cfg.simulation.passive_heal_amount);
    read_key(root, "content_path", cfg.content_path);
    read_key(root, "map_layout", cfg.map_layout);
    read_key(root, "log_level", cfg.log_level);
    read_key(root, "log_json", cfg.log_json);
    read_key(root, "metrics_port", cfg.metrics_port);
    read_key(root, "auto_queue_mode", cfg.auto_queue_mode);
    read_key(root, "fixed_seed", cfg.fixed_seed);
    read_key(root, "max_frame_bytes", cfg.max_frame_bytes);
    if (const YAML::Node modes = root["modes"]) {
        if (!modes.IsSequence())
            throw std::runtime_error("config key 'modes': expected a list");
        cfg.modes.clear();
        for (const auto &m : modes)
            cfg.modes.push_back(parse_mode(m));
    }
    if (const YAML::Node sim = root["simulation"]) {
        if (!sim.IsMap())
            throw std::runtime_error("config key 'simulation': expected a map");
        parse_simulation(sim, cfg.simulation);
    }
    cfg.simulation.tick_rate = cfg.tick_rate;
    validate_config(cfg);
    return cfg;
}

ServerConfig load_config(const std::string &path)
{
    return parse_config(YAML::LoadFile(path));
}

void apply_env_overrides(ServerConfig &cfg, EnvLookup env)
{
    auto lookup = [&](const char *name) -> const char * { return env ? env(name) : std::getenv(name); };
    if (const char *port = lookup("PORT"); port && *port) {
        char *end = nullptr;
        const long v = std::strtol(port, &end, 10);
        if (*end != '\0' || v <= 0 || v > 65535)
            throw std::runtime_error(std::string("PORT: invalid value '") + port + "'");
        cfg.listen_port = static_cast<uint16_t>(v);
    }
    if (const char *origins = lookup("ALLOWED_ORIGINS"))
        cfg.allowed_origins = parse_origins(origins);
}

void validate_config(const ServerConfig &cfg)
{
    if (cfg.tick_rate == 0 || cfg.tick_rate > 1000)
        throw std::runtime_error("config key 'tick_rate': must be within 1..1000");
    if (cfg.heartbeat_timeout_seconds == 0)
        throw std::runtime_error("config key 'heartbeat_timeout_seconds': must be positive");
    if (cfg.modes.empty())
        throw std::runtime_error("config key 'modes': at least one mode required");
    std::unordered_set<std::string> names;
    for (const auto &m : cfg.modes) {
        if (m.name.empty())
            throw std::runtime_error("config key 'modes': mode without name");
        if (!names.insert(m.name).second)
            throw std::runtime_error("config key 'modes': duplicate mode '" + m.name + "'");
        if (m.max_players == 0 || m.min_players > m.max_players)
            throw std::runtime_error("config key 'modes': invalid player bounds for '" + m.name + "'");
    }
    if (!cfg.auto_queue_mode.empty() && names.count(cfg.auto_queue_mode) == 0)
        throw std::runtime_error("config key 'auto_queue_mode': unknown mode '" + cfg.auto_queue_mode + "'");
}

} // namespace arena::config
