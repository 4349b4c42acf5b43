// SPDX-License-Identifier: Apache-2.0
#include "server/game/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace arena::geo {

namespace {

struct EdgeHit
{
    b2Vec2 closest{0.f, 0.f};
    b2Vec2 edge{0.f, 0.f};
    float distance{std::numeric_limits<float>::max()};
};

b2Vec2 closest_on_segment(b2Vec2 p, b2Vec2 a, b2Vec2 b)
{
    b2Vec2 ab = b2Sub(b, a);
    float len_sq = b2Dot(ab, ab);
    float t = len_sq > 0.f ? b2Dot(b2Sub(p, a), ab) / len_sq : 0.f;
    t = std::clamp(t, 0.f, 1.f);
    return b2MulAdd(a, t, ab);
}

EdgeHit nearest_edge(b2Vec2 p, std::span<const b2Vec2> poly)
{
    EdgeHit best;
    const size_t n = poly.size();
    for (size_t i = 0; i < n; ++i) {
        b2Vec2 a = poly[i];
        b2Vec2 b = poly[(i + 1) % n];
        b2Vec2 c = closest_on_segment(p, a, b);
        float d = b2Distance(p, c);
        if (d < best.distance) {
            best.distance = d;
            best.closest = c;
            best.edge = b2Sub(b, a);
        }
    }
    return best;
}

void remove_inward_velocity(b2Vec2 &vel, b2Vec2 n)
{
    float vn = b2Dot(vel, n);
    if (vn < 0.f)
        vel = b2MulAdd(vel, -vn, n);
}

bool resolve_rect(b2Vec2 &pos, b2Vec2 &vel, float radius, const RectWall &r)
{
    b2Vec2 q{std::clamp(pos.x, r.x, r.x + r.w), std::clamp(pos.y, r.y, r.y + r.h)};
    b2Vec2 delta = b2Sub(pos, q);
    float d = b2Length(delta);
    if (d >= radius)
        return false;
    if (d > 0.f) {
        b2Vec2 n = b2MulSV(1.f / d, delta);
        pos = b2MulAdd(q, radius, n);
        remove_inward_velocity(vel, n);
        return true;
    }
    // Center on or inside the rectangle: leave through the closest side.
    float left = pos.x - r.x;
    float right = r.x + r.w - pos.x;
    float bottom = pos.y - r.y;
    float top = r.y + r.h - pos.y;
    float pen_x = std::min(left, right);
    float pen_y = std::min(bottom, top);
    if (pen_x <= pen_y)
        pos.x = left <= right ? r.x - radius : r.x + r.w + radius;
    else
        pos.y = bottom <= top ? r.y - radius : r.y + r.h + radius;
    vel = b2Vec2{0.f, 0.f};
    return true;
}

bool resolve_polygon(b2Vec2 &pos, b2Vec2 &vel, float radius, const PolygonWall &w)
{
    if (w.points.size() < 3)
        return false;
    bool moved = false;
    // A push out of one edge can land inside the reach of the neighbouring edge at concave corners.
    for (int pass = 0; pass < 4; ++pass) {
        bool inside = point_in_polygon(pos, w.points);
        EdgeHit hit = nearest_edge(pos, w.points);
        if (!inside && hit.distance >= radius)
            break;
        if (b2Length(hit.edge) <= 0.f)
            break;
        b2Vec2 n = b2Normalize(b2LeftPerp(hit.edge));
        if (point_in_polygon(b2MulAdd(hit.closest, 1.f, n), w.points))
            n = b2MulSV(-1.f, n);
        pos = b2MulAdd(hit.closest, radius, n);
        remove_inward_velocity(vel, n);
        moved = true;
    }
    return moved;
}

} // namespace

bool point_in_polygon(b2Vec2 p, std::span<const b2Vec2> poly)
{
    bool inside = false;
    const size_t n = poly.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const b2Vec2 &pi = poly[i];
        const b2Vec2 &pj = poly[j];
        if ((pi.y > p.y) != (pj.y > p.y)) {
            float x_cross = (pj.x - pi.x) * (p.y - pi.y) / (pj.y - pi.y) + pi.x;
            if (p.x < x_cross)
                inside = !inside;
        }
    }
    return inside;
}

bool point_in_solid(b2Vec2 p, const Wall &w, float margin)
{
    if (const auto *r = std::get_if<RectWall>(&w)) {
        return p.x >= r->x - margin && p.x <= r->x + r->w + margin && p.y >= r->y - margin
            && p.y <= r->y + r->h + margin;
    }
    return point_in_polygon(p, std::get<PolygonWall>(w).points);
}

bool point_in_any_wall(b2Vec2 p, std::span<const Wall> walls, float margin)
{
    return std::any_of(walls.begin(), walls.end(), [&](const Wall &w) { return point_in_solid(p, w, margin); });
}

bool resolve_circle(b2Vec2 &pos, b2Vec2 &vel, float radius, const Wall &w)
{
    if (const auto *r = std::get_if<RectWall>(&w))
        return resolve_rect(pos, vel, radius, *r);
    return resolve_polygon(pos, vel, radius, std::get<PolygonWall>(w));
}

void resolve_against_walls(b2Vec2 &pos, b2Vec2 &vel, float radius, std::span<const Wall> walls)
{
    for (const auto &w : walls)
        resolve_circle(pos, vel, radius, w);
}

b2Vec2 clamp_to_map(b2Vec2 p, float map_half, float radius)
{
    float limit = std::max(0.f, map_half - radius - 1.f);
    return b2Vec2{std::clamp(p.x, -limit, limit), std::clamp(p.y, -limit, limit)};
}

} // namespace arena::geo
