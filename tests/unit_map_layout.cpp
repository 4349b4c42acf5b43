// SPDX-License-Identifier: Apache-2.0
#include "server/game/map_layout.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <variant>
#include <vector>

using namespace arena::game;

int main()
{
    {
        std::vector<b2Vec2> square{{0.f, 0.f}, {10.f, 0.f}, {10.f, 10.f}, {0.f, 10.f}};
        assert(validate_polygon(square) == PolygonVerdict::ok);
        std::vector<b2Vec2> bowtie{{0.f, 0.f}, {10.f, 10.f}, {10.f, 0.f}, {0.f, 10.f}};
        assert(validate_polygon(bowtie) == PolygonVerdict::self_intersecting);
        std::vector<b2Vec2> degenerate{{0.f, 0.f}, {5.f, 5.f}, {0.f, 0.f}};
        assert(validate_polygon(degenerate) == PolygonVerdict::too_few_points);
        assert(std::string(to_string(PolygonVerdict::self_intersecting)) == "self_intersecting");
    }
    {
        std::vector<b2Vec2> line{{0.f, 0.f}, {100.f, 0.f}};
        auto outline = thicken_polyline(line, 20.f);
        assert(outline.size() == 4);
        assert(outline[0].x == 0.f && outline[0].y == 10.f);
        assert(outline[1].x == 100.f && outline[1].y == 10.f);
        assert(outline[2].x == 100.f && outline[2].y == -10.f);
        assert(outline[3].x == 0.f && outline[3].y == -10.f);
        assert(validate_polygon(outline) == PolygonVerdict::ok);
        std::vector<b2Vec2> single{{1.f, 1.f}};
        assert(thicken_polyline(single, 20.f).empty());
    }
    {
        b2Vec2 c = grid_to_world_center(9000.f, 1, 1);
        assert(std::fabs(c.x + 8250.f) < 1e-2f && std::fabs(c.y + 8250.f) < 1e-2f);
        b2Vec2 d = grid_to_world_center(9000.f, 12, 12);
        assert(std::fabs(d.x - 8250.f) < 1e-2f);
    }
    {
        auto maze = load_layout("maze", 9000.f);
        assert(maze.name == "maze" || maze.name == "fallback_grid");
        assert(!maze.walls.empty());
        if (maze.name == "maze") {
            const auto &poly = std::get<arena::geo::PolygonWall>(maze.walls.front());
            assert(validate_polygon(poly.points) == PolygonVerdict::ok);
        }
        auto grid = build_fallback_layout(9000.f);
        assert(grid.name == "fallback_grid");
        assert(grid.walls.size() == 36);
        const auto &top = std::get<arena::geo::RectWall>(grid.walls.front());
        // gap = max(24, 1500 * 0.05) = 75
        assert(top.id == "outer_top");
        assert(std::fabs(top.x - (-9000.f + 75.f)) < 1e-2f);
        assert(std::fabs(top.h - (1500.f - 150.f)) < 1e-2f);
        assert(load_layout("open", 9000.f).walls.empty());
        auto unknown = load_layout("no_such_layout", 9000.f);
        assert(unknown.name == "maze" || unknown.name == "fallback_grid");
    }
    std::cout << "unit_map_layout OK" << std::endl;
    return 0;
}
