// SPDX-License-Identifier: Apache-2.0
#include "server/game/geometry.hpp"
#include "server/game/simulation.hpp"
#include "test_world.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace arena;

static bool near(float a, float b, float eps = 1e-3f)
{
    return std::fabs(a - b) <= eps;
}

int main()
{
    // Player walking into the left face of a rectangle stops flush against it.
    {
        game::MapLayout layout{"test", {geo::RectWall{"block", 0.f, 0.f, 100.f, 100.f}}};
        auto world = test::make_world(1, layout);
        auto &p = world.add_player("1", "walker", "warrior");
        p.pos = b2Vec2{-28.f, 50.f};
        p.input = b2Vec2{1.f, 0.f};
        game::update_players(world, 1000);
        assert(near(p.pos.x, -28.f));
        assert(near(p.pos.y, 50.f));
        assert(near(p.vel.x, 0.f));
    }
    // Tangential velocity survives a wall contact.
    {
        geo::Wall w = geo::RectWall{"r", 0.f, 0.f, 100.f, 100.f};
        b2Vec2 pos{-10.f, 50.f};
        b2Vec2 vel{50.f, 30.f};
        assert(geo::resolve_circle(pos, vel, 20.f, w));
        assert(near(pos.x, -20.f));
        assert(near(vel.x, 0.f));
        assert(near(vel.y, 30.f));
    }
    // Circle centre inside a rectangle leaves through the nearest side.
    {
        geo::Wall w = geo::RectWall{"r", 0.f, 0.f, 100.f, 100.f};
        b2Vec2 pos{95.f, 40.f};
        b2Vec2 vel{1.f, 1.f};
        assert(geo::resolve_circle(pos, vel, 10.f, w));
        assert(near(pos.x, 110.f));
        assert(near(vel.x, 0.f) && near(vel.y, 0.f));
    }
    // Polygons: even-odd containment and push-out.
    {
        std::vector<b2Vec2> square{{0.f, 0.f}, {100.f, 0.f}, {100.f, 100.f}, {0.f, 100.f}};
        assert(geo::point_in_polygon(b2Vec2{50.f, 50.f}, square));
        assert(!geo::point_in_polygon(b2Vec2{150.f, 50.f}, square));
        geo::Wall w = geo::PolygonWall{"poly", square};
        assert(geo::point_in_solid(b2Vec2{10.f, 10.f}, w));
        b2Vec2 pos{105.f, 50.f};
        b2Vec2 vel{-40.f, 0.f};
        assert(geo::resolve_circle(pos, vel, 10.f, w));
        assert(near(pos.x, 110.f));
        assert(near(vel.x, 0.f));
        b2Vec2 far{300.f, 50.f};
        b2Vec2 still{0.f, 0.f};
        assert(!geo::resolve_circle(far, still, 10.f, w));
    }
    // Rectangle margin applies to point tests only.
    {
        geo::Wall w = geo::RectWall{"r", 0.f, 0.f, 10.f, 10.f};
        assert(!geo::point_in_solid(b2Vec2{-5.f, 5.f}, w));
        assert(geo::point_in_solid(b2Vec2{-5.f, 5.f}, w, 8.f));
    }
    // Map clamp keeps the whole circle inside with one unit of slack.
    {
        b2Vec2 c = geo::clamp_to_map(b2Vec2{10000.f, -10000.f}, 9000.f, 28.f);
        assert(near(c.x, 8971.f) && near(c.y, -8971.f));
    }
    std::cout << "unit_geometry OK" << std::endl;
    return 0;
}
