// SPDX-License-Identifier: Apache-2.0
#include "server/game/map_layout.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace arena::game {

namespace {

constexpr std::array<std::pair<int, int>, 26> kCenterline{{
    {2, 1}, {2, 3}, {4, 3}, {4, 1}, {6, 1}, {6, 3}, {8, 3}, {8, 1}, {10, 1}, {10, 3}, {10, 5}, {8, 5}, {8, 7},
    {6, 7}, {6, 5}, {4, 5}, {4, 7}, {2, 7}, {2, 9}, {4, 9}, {4, 11}, {6, 11}, {6, 9}, {8, 9}, {8, 11}, {10, 11},
}};

struct BoxSpec
{
    int col;
    int row;
    int w_cells;
    int h_cells;
    const char *id;
};

constexpr std::array<BoxSpec, 36> kFallbackBoxes{{
    {1, 1, 12, 1, "outer_top"},
    {1, 12, 12, 1, "outer_bottom"},
    {1, 1, 1, 12, "outer_left"},
    {12, 1, 1, 12, "outer_right"},
    {2, 2, 1, 3, "v_left_1"},
    {2, 6, 1, 3, "v_left_2"},
    {2, 10, 1, 2, "v_left_3"},
    {3, 2, 4, 1, "h_top_spiral"},
    {6, 3, 1, 3, "v_spiral_center"},
    {4, 5, 4, 1, "h_mid_spiral"},
    {6, 1, 1, 12, "center_bar_full"},
    {8, 2, 1, 2, "v_right_1"},
    {10, 2, 1, 2, "v_right_2"},
    {9, 4, 3, 1, "h_right_mid_1"},
    {8, 6, 1, 3, "v_right_mid_2"},
    {10, 9, 1, 2, "v_right_bottom"},
    {3, 8, 2, 1, "box_lower_left_1"},
    {2, 9, 1, 2, "v_lower_left"},
    {4, 10, 3, 1, "h_lower_left"},
    {7, 9, 2, 1, "box_lower_center"},
    {9, 10, 2, 1, "box_lower_right"},
    {11, 8, 1, 2, "v_lower_right"},
    {4, 3, 1, 1, "island_a"},
    {5, 6, 1, 1, "island_b"},
    {8, 4, 1, 1, "island_c"},
    {7, 7, 1, 1, "island_d"},
    {3, 7, 4, 1, "h_middle_left"},
    {5, 4, 1, 2, "v_inner_left_connector"},
    {9, 5, 1, 2, "v_inner_right_connector"},
    {5, 11, 2, 1, "h_near_bottom_center"},
    {10, 11, 1, 1, "h_near_bottom_right"},
    {6, 4, 1, 1, "block_center_1"},
    {8, 8, 1, 1, "block_center_2"},
    {3, 10, 1, 1, "block_ll"},
    {11, 3, 1, 1, "block_ur"},
    {7, 3, 1, 1, "block_mid_top"},
}};

float cell_size(float map_half)
{
    return map_half * 2.f / static_cast<float>(kGridCells);
}

// Products of map-sized coordinates exceed float precision.
double cross(b2Vec2 a, b2Vec2 b, b2Vec2 c)
{
    return (double(b.x) - a.x) * (double(c.y) - a.y) - (double(b.y) - a.y) * (double(c.x) - a.x);
}

bool segments_cross(b2Vec2 a, b2Vec2 b, b2Vec2 c, b2Vec2 d)
{
    double o1 = cross(a, b, c);
    double o2 = cross(a, b, d);
    double o3 = cross(c, d, a);
    double o4 = cross(c, d, b);
    return ((o1 > 0.0) != (o2 > 0.0)) && ((o3 > 0.0) != (o4 > 0.0)) && o1 != 0.0 && o2 != 0.0 && o3 != 0.0
        && o4 != 0.0;
}

} // namespace

const char *to_string(PolygonVerdict v)
{
    switch (v) {
        case PolygonVerdict::ok:
            return "ok";
        case PolygonVerdict::too_few_points:
            return "too_few_points";
        case PolygonVerdict::self_intersecting:
            return "self_intersecting";
    }
    return "unknown";
}

PolygonVerdict validate_polygon(std::span<const b2Vec2> points)
{
    std::vector<b2Vec2> distinct;
    for (const auto &p : points) {
        bool seen = false;
        for (const auto &q : distinct)
            if (q.x == p.x && q.y == p.y)
                seen = true;
        if (!seen)
            distinct.push_back(p);
    }
    if (distinct.size() < 3)
        return PolygonVerdict::too_few_points;
    const size_t n = points.size();
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (j == i + 1 || (i == 0 && j == n - 1))
                continue;
            if (segments_cross(points[i], points[(i + 1) % n], points[j], points[(j + 1) % n]))
                return PolygonVerdict::self_intersecting;
        }
    }
    return PolygonVerdict::ok;
}

std::vector<b2Vec2> thicken_polyline(std::span<const b2Vec2> points, float thickness)
{
    if (points.size() < 2)
        return {};
    const float half = thickness * 0.5f;
    std::vector<b2Vec2> normals;
    normals.reserve(points.size() - 1);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        b2Vec2 dir = b2Normalize(b2Sub(points[i + 1], points[i]));
        normals.push_back(b2LeftPerp(dir));
    }
    std::vector<b2Vec2> left;
    std::vector<b2Vec2> right;
    for (size_t i = 0; i < points.size(); ++i) {
        b2Vec2 n;
        if (i == 0) {
            n = normals.front();
        } else if (i == points.size() - 1) {
            n = normals.back();
        } else {
            b2Vec2 sum = b2Add(normals[i - 1], normals[i]);
            // Hairpin: the two normals cancel out.
            n = b2Length(sum) < 1e-4f ? normals[i] : b2Normalize(sum);
        }
        left.push_back(b2MulAdd(points[i], half, n));
        right.push_back(b2MulAdd(points[i], -half, n));
    }
    std::vector<b2Vec2> outline;
    outline.reserve(left.size() * 2);
    auto rounded = [](b2Vec2 p) { return b2Vec2{std::round(p.x), std::round(p.y)}; };
    for (const auto &p : left)
        outline.push_back(rounded(p));
    for (auto it = right.rbegin(); it != right.rend(); ++it)
        outline.push_back(rounded(*it));
    return outline;
}

b2Vec2 grid_to_world_center(float map_half, int col, int row)
{
    float cell = cell_size(map_half);
    return b2Vec2{
        -map_half + (static_cast<float>(col) - 0.5f) * cell, -map_half + (static_cast<float>(row) - 0.5f) * cell};
}

MapLayout build_maze_layout(float map_half)
{
    std::vector<b2Vec2> centerline;
    centerline.reserve(kCenterline.size());
    for (auto [col, row] : kCenterline)
        centerline.push_back(grid_to_world_center(map_half, col, row));
    const float thickness = std::max(std::floor(cell_size(map_half) * 0.9f), kWallThickness * 0.8f);
    auto outline = thicken_polyline(centerline, thickness);
    auto verdict = validate_polygon(outline);
    if (verdict != PolygonVerdict::ok) {
        arena::log::warn("[map] maze outline rejected ({}), using fallback_grid", to_string(verdict));
        return build_fallback_layout(map_half);
    }
    MapLayout layout;
    layout.name = "maze";
    layout.walls.emplace_back(geo::PolygonWall{"maze_wall_poly_1", std::move(outline)});
    return layout;
}

MapLayout build_fallback_layout(float map_half)
{
    const float cell = cell_size(map_half);
    const float gap = std::floor(std::max(24.f, cell * 0.05f));
    MapLayout layout;
    layout.name = "fallback_grid";
    layout.walls.reserve(kFallbackBoxes.size());
    for (const auto &b : kFallbackBoxes) {
        geo::RectWall r;
        r.id = b.id;
        r.x = -map_half + static_cast<float>(b.col - 1) * cell + gap;
        r.y = -map_half + static_cast<float>(b.row - 1) * cell + gap;
        r.w = static_cast<float>(std::max(1, b.w_cells)) * cell - gap * 2.f;
        r.h = static_cast<float>(std::max(1, b.h_cells)) * cell - gap * 2.f;
        layout.walls.emplace_back(std::move(r));
    }
    return layout;
}

MapLayout build_open_layout()
{
    return MapLayout{"open", {}};
}

MapLayout load_layout(std::string_view name, float map_half)
{
    if (name == "open")
        return build_open_layout();
    if (name == "fallback_grid")
        return build_fallback_layout(map_half);
    if (name != "maze")
        arena::log::warn("[map] unknown layout '{}', using maze", name);
    return build_maze_layout(map_half);
}

} // namespace arena::game
