#pragma once
#include "rc/radar/Types.hpp"
#include <cmath>

namespace rc {

inline constexpr double kPi = 3.14159265358979323846;

inline double degToRad(double deg) { return deg * (kPi / 180.0); }
inline double radToDeg(double rad) { return rad * (180.0 / kPi); }

// Map any angle in degrees into [0, 360).
inline double normalizeAngle(double deg) {
  double a = std::fmod(deg, 360.0);
  if (a < 0.0) a += 360.0;
  // fmod of a tiny negative value can round up to exactly 360
  if (a >= 360.0) a = 0.0;
  return a;
}

// Move `p` by `distance` along `angleDeg`.
// Screen space is y-down: 0 deg points to +x, angles grow clockwise.
inline Point movePoint(const Point& p, double distance, double angleDeg) {
  double rad = degToRad(angleDeg);
  return Point{p.x + distance * std::cos(rad), p.y + distance * std::sin(rad)};
}

inline double distanceBetween(const Point& a, const Point& b) {
  double dx = a.x - b.x;
  double dy = a.y - b.y;
  return std::sqrt(dx * dx + dy * dy);
}

} // namespace rc
