// SPDX-License-Identifier: Apache-2.0
// world.hpp - entity registry owned by one match; the only state the simulation functions mutate
#pragma once
#include "game.pb.h"
#include "server/game/content.hpp"
#include "server/game/entities.hpp"
#include "server/game/map_layout.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arena::game {

struct SimulationConfig
{
    float map_half{9000.f};
    uint32_t tick_rate{20};

    float player_radius{28.f};
    float player_max_hp{200.f};
    float player_base_damage{18.f};
    float player_base_speed{380.f};
    TimeMs player_attack_cooldown_ms{600};
    TimeMs respawn_invulnerability_ms{3000};
    uint32_t respawn_attempts{50};
    // Fraction of the map side sampled for random player spawns
    float respawn_area_fraction{0.8f};
    float respawn_wall_margin{40.f};

    float mob_spawn_jitter{360.f};
    uint32_t mob_spawn_attempts{12};
    float mob_wall_margin{8.f};
    // Extra reach added to radius sums for auto-attacks and mob contact
    float contact_pad{6.f};
    float mob_attack_factor{0.8f};
    float mob_idle_damping{0.9f};
    float mob_stun_damping{0.8f};

    float gold_steal_fraction{0.05f};
    float level_hp_bonus{50.f};
    float level_xp_growth{1.3f};
    uint32_t leaderboard_size{10};

    TimeMs passive_heal_interval_ms{1000};
    float passive_heal_amount{4.f};

    bool include_dead_players{true};
    bool snapshot_walls{false};

    float dt() const { return 1.f / static_cast<float>(tick_rate == 0 ? 1 : tick_rate); }
};

// Messages produced by one simulation step, fanned out by the owning match.
struct Outbox
{
    std::vector<arena::ServerMessage> broadcast;
    std::vector<std::pair<std::string, arena::ServerMessage>> direct;

    bool empty() const { return broadcast.empty() && direct.empty(); }

    void clear()
    {
        broadcast.clear();
        direct.clear();
    }
};

struct World
{
    World(SimulationConfig config, std::shared_ptr<const GameContent> game_content, MapLayout map, uint32_t seed);

    SimulationConfig cfg;
    std::shared_ptr<const GameContent> content;
    MapLayout layout;
    std::vector<Player> players;
    std::vector<Mob> mobs;
    std::vector<Projectile> projectiles;
    std::mt19937 rng;
    uint64_t next_mob_id{1};
    uint64_t next_projectile_id{1};
    uint64_t server_tick{0};
    uint64_t ledger_seq{0};
    TimeMs last_heal_at{0};
    Outbox outbox;

    std::span<const geo::Wall> walls() const { return layout.walls; }

    Player *find_player(std::string_view id);
    const Player *find_player(std::string_view id) const;
    Mob *find_mob(std::string_view id);

    // Unknown class names resolve to the content's default class.
    Player &add_player(std::string id, std::string name, std::string_view class_name);
    bool remove_player(std::string_view id);

    // Populates every spawn point with its configured mob counts.
    void spawn_initial_mobs();
    // Builds a fresh mob near the spawn point (not inserted).
    Mob make_mob(size_t spawn_index, const MobDef &def);
    // Random open position within the central area, origin when every attempt hits a wall.
    b2Vec2 random_player_spawn();

    void emit(arena::ServerMessage msg);
    void emit_to(const std::string &player_id, arena::ServerMessage msg);
};

// Players ordered by kills (descending, stable on join order), at most limit entries.
std::vector<const Player *> top_players_by_kills(const World &world, size_t limit);

} // namespace arena::game
