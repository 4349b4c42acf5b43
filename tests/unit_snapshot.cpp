// SPDX-License-Identifier: Apache-2.0
#include "server/game/snapshot.hpp"
#include "test_world.hpp"

#include <cassert>
#include <iostream>

using namespace arena;

int main()
{
    // Coordinates are rounded, dead mobs are omitted, dead players follow the config switch.
    {
        auto world = test::make_world();
        auto &a = world.add_player("1", "alice", "warrior");
        auto &b = world.add_player("2", "bob", "mage");
        a.pos = b2Vec2{10.4f, -20.6f};
        a.vel = b2Vec2{0.5f, -0.5f};
        a.hp = 150.25f;
        a.stunned_until = 2000;
        b.hp = 0.f;
        world.mobs.push_back(world.make_mob(0, *world.content->find_mob("wolf")));
        world.mobs.push_back(world.make_mob(0, *world.content->find_mob("goblin")));
        world.mobs.back().hp = 0.f;
        world.mobs.back().respawn_at = 99999;
        world.mobs.front().stunned_until = 500;
        game::Projectile pr;
        pr.id = "proj_1";
        pr.owner_id = a.id;
        pr.type = "arrow";
        pr.pos = b2Vec2{1.5f, 2.4f};
        pr.expires_at = 1400;
        world.projectiles.push_back(pr);
        world.server_tick = 42;

        auto snap = game::build_snapshot(world, 1000, false);
        assert(snap.server_tick() == 42 && snap.time_ms() == 1000);
        assert(snap.players_size() == 2);
        const auto &ps = snap.players(0);
        assert(ps.id() == "1" && ps.name() == "alice" && ps.class_name() == "warrior");
        assert(ps.x() == 10 && ps.y() == -21);
        assert(ps.hp() == 150);
        assert(ps.stunned() && !ps.invulnerable());
        assert(snap.players(1).hp() == 0);
        assert(snap.mobs_size() == 1);
        assert(snap.mobs(0).type() == "wolf");
        // Elapsed stuns are reported as zero.
        assert(snap.mobs(0).stunned_until() == 0);
        assert(snap.projectiles_size() == 1);
        assert(snap.projectiles(0).x() == 2 && snap.projectiles(0).y() == 2);
        assert(snap.projectiles(0).ttl_ms() == 400);
        assert(snap.walls_size() == 0);

        world.cfg.include_dead_players = false;
        snap = game::build_snapshot(world, 1000, false);
        assert(snap.players_size() == 1 && snap.players(0).id() == "1");
    }
    // Leaderboard is ordered by kills, ties keep join order, and is capped.
    {
        game::SimulationConfig cfg;
        cfg.leaderboard_size = 2;
        auto world = test::make_world(7, game::build_open_layout(), cfg);
        world.add_player("1", "a", "warrior").kills = 1;
        world.add_player("2", "b", "warrior").kills = 3;
        world.add_player("3", "c", "warrior").kills = 1;
        auto snap = game::build_snapshot(world, 0, false);
        assert(snap.leaderboard_size() == 2);
        assert(snap.leaderboard(0).player_id() == "2" && snap.leaderboard(0).kills() == 3);
        assert(snap.leaderboard(1).player_id() == "1");
    }
    // Walls are only attached on request; the welcome always carries them.
    {
        auto world = test::make_world(7, game::build_maze_layout(9000.f));
        auto &p = world.add_player("1", "a", "ranger");
        p.pos = b2Vec2{100.f, 200.f};
        auto snap = game::build_snapshot(world, 0, true);
        assert(snap.walls_size() == static_cast<int>(world.layout.walls.size()));
        assert(snap.walls_size() > 0);

        auto welcome = game::make_welcome(world, p, "m_1");
        assert(welcome.has_welcome());
        assert(welcome.welcome().player_id() == "1" && welcome.welcome().match_id() == "m_1");
        assert(welcome.welcome().map_half() == 9000 && welcome.welcome().tick_rate() == 20);
        assert(welcome.welcome().walls_size() == snap.walls_size());
        assert(welcome.welcome().spawn().x() == 100 && welcome.welcome().spawn().y() == 200);
    }
    std::cout << "unit_snapshot OK" << std::endl;
    return 0;
}
