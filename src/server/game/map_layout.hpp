// SPDX-License-Identifier: Apache-2.0
// map_layout.hpp - named static wall sets built on a 12x12 cell grid over the square map
#pragma once
#include "server/game/geometry.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace arena::game {

struct MapLayout
{
    std::string name;
    std::vector<geo::Wall> walls;
};

enum class PolygonVerdict
{
    ok,
    too_few_points,
    self_intersecting
};

const char *to_string(PolygonVerdict v);

// Requires at least 3 distinct vertices and no crossing between non-adjacent edges.
PolygonVerdict validate_polygon(std::span<const b2Vec2> points);

// Offsets the polyline to both sides by thickness/2 using averaged segment normals and closes the outline.
// Vertices are rounded to whole units. Returns an empty vector for fewer than 2 input points.
std::vector<b2Vec2> thicken_polyline(std::span<const b2Vec2> points, float thickness);

constexpr int kGridCells = 12;
constexpr float kWallThickness = 672.f;

// Center of grid cell (col,row), both 1-based.
b2Vec2 grid_to_world_center(float map_half, int col, int row);

MapLayout build_maze_layout(float map_half);
MapLayout build_fallback_layout(float map_half);
MapLayout build_open_layout();

// "maze" (falls back to "fallback_grid" when the generated outline is invalid), "fallback_grid" or "open".
// Unknown names resolve to "maze".
MapLayout load_layout(std::string_view name, float map_half);

} // namespace arena::game
