// SPDX-License-Identifier: Apache-2.0
// geometry.hpp - static collision shapes and circle-vs-shape resolution
#pragma once
#include <box2d/math_functions.h>

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace arena::geo {

// Axis-aligned rectangle; (x, y) is the minimum corner.
struct RectWall
{
    std::string id;
    float x{0.f};
    float y{0.f};
    float w{0.f};
    float h{0.f};
};

// Simple polygon, vertices in order (either winding), implicitly closed.
struct PolygonWall
{
    std::string id;
    std::vector<b2Vec2> points;
};

using Wall = std::variant<RectWall, PolygonWall>;

// Even-odd ray cast.
bool point_in_polygon(b2Vec2 p, std::span<const b2Vec2> poly);

// Rectangles are tested inclusively and inflated by margin; polygons ignore margin.
bool point_in_solid(b2Vec2 p, const Wall &w, float margin = 0.f);
bool point_in_any_wall(b2Vec2 p, std::span<const Wall> walls, float margin = 0.f);

// Pushes a circle out of the shape along the minimum translation vector and removes the velocity component
// pointing into the surface. Returns true when the circle was moved.
bool resolve_circle(b2Vec2 &pos, b2Vec2 &vel, float radius, const Wall &w);

// Resolves against every wall in list order, one wall at a time.
void resolve_against_walls(b2Vec2 &pos, b2Vec2 &vel, float radius, std::span<const Wall> walls);

// Clamps a circle center so the whole circle stays inside the square [-half, half]^2 with one unit of slack.
b2Vec2 clamp_to_map(b2Vec2 p, float map_half, float radius);

} // namespace arena::geo
