#pragma once
#include <cmath>
#include <vector>

namespace site {

// Warehouse frame: x to the right, y up, metres.
struct Vec2 {
  double x = 0.0;
  double y = 0.0;
};

inline Vec2 operator+(const Vec2& a, const Vec2& b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(const Vec2& a, double s) { return {a.x * s, a.y * s}; }

double dot(const Vec2& a, const Vec2& b);
double norm(const Vec2& a);
double distance(const Vec2& a, const Vec2& b);
bool is_finite(const Vec2& a);

// Direction of v in radians, counter-clockwise from +x.
double direction_of(const Vec2& v);

// Bearing of `to` as seen from `from`, measured clockwise from `heading`
// (radians, same convention as direction_of). Degrees in [0, 360).
double relative_bearing_deg(const Vec2& from, double heading, const Vec2& to);

using Polygon = std::vector<Vec2>;

// Even-odd rule. Polygons need at least 3 vertices.
bool contains(const Polygon& poly, const Vec2& p);

// True if any part of segment a->b lies inside or touches the polygon.
bool segment_enters(const Polygon& poly, const Vec2& a, const Vec2& b);

} // namespace site
