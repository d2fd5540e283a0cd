#include "site_env/geometry.hpp"
#include <algorithm>

namespace site {

static constexpr double kPi = 3.14159265358979323846;

static double norm_deg(double a) {
  a = std::fmod(a, 360.0);
  if (a < 0.0) a += 360.0;
  if (a >= 360.0) a = 0.0;
  return a;
}

// >0 when c is left of a->b, <0 when right, 0 when collinear.
static double orient(const Vec2& a, const Vec2& b, const Vec2& c) {
  return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

static bool on_segment(const Vec2& a, const Vec2& b, const Vec2& p) {
  return std::min(a.x, b.x) <= p.x && p.x <= std::max(a.x, b.x) &&
         std::min(a.y, b.y) <= p.y && p.y <= std::max(a.y, b.y);
}

static bool segments_touch(const Vec2& p1, const Vec2& p2, const Vec2& q1, const Vec2& q2) {
  double d1 = orient(q1, q2, p1);
  double d2 = orient(q1, q2, p2);
  double d3 = orient(p1, p2, q1);
  double d4 = orient(p1, p2, q2);

  if (((d1 > 0 && d2 < 0) || (d1 < 0 && d2 > 0)) &&
      ((d3 > 0 && d4 < 0) || (d3 < 0 && d4 > 0)))
    return true;

  if (d1 == 0 && on_segment(q1, q2, p1)) return true;
  if (d2 == 0 && on_segment(q1, q2, p2)) return true;
  if (d3 == 0 && on_segment(p1, p2, q1)) return true;
  if (d4 == 0 && on_segment(p1, p2, q2)) return true;
  return false;
}

double dot(const Vec2& a, const Vec2& b) { return a.x * b.x + a.y * b.y; }
double norm(const Vec2& a) { return std::sqrt(dot(a, a)); }
double distance(const Vec2& a, const Vec2& b) { return norm(b - a); }

bool is_finite(const Vec2& a) { return std::isfinite(a.x) && std::isfinite(a.y); }

double direction_of(const Vec2& v) { return std::atan2(v.y, v.x); }

double relative_bearing_deg(const Vec2& from, double heading, const Vec2& to) {
  double toward = direction_of(to - from);
  // counter-clockwise offset, flipped so that the right-hand side reads 90
  double ccw = (toward - heading) * 180.0 / kPi;
  return norm_deg(-ccw);
}

bool contains(const Polygon& poly, const Vec2& p) {
  if (poly.size() < 3) return false;

  bool inside = false;
  for (std::size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++) {
    const Vec2& a = poly[i];
    const Vec2& b = poly[j];
    if ((a.y > p.y) != (b.y > p.y)) {
      double x_cross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
      if (p.x < x_cross) inside = !inside;
    }
  }
  return inside;
}

bool segment_enters(const Polygon& poly, const Vec2& a, const Vec2& b) {
  if (poly.size() < 3) return false;
  if (contains(poly, a) || contains(poly, b)) return true;

  for (std::size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++) {
    if (segments_touch(a, b, poly[j], poly[i])) return true;
  }
  return false;
}

} // namespace site
