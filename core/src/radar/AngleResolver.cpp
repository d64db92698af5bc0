#include "rc/radar/AngleResolver.hpp"
#include "rc/radar/SliceGeometry.hpp"
#include "rc/math/Angle.hpp"
#include <cmath>

namespace rc {

double referenceAngle(int index, double sliceAngle) {
  return sliceAngle * static_cast<double>(index + 1) - sliceAngle / 2.0;
}

int indexForAngle(double absoluteAngleDegrees, double rotationDegrees, int entryCount) {
  if (entryCount <= 0) return 0;

  double a = normalizeAngle(absoluteAngleDegrees - rotationDegrees);
  double slice = sliceAngleDegrees(entryCount);

  for (int i = 0; i < entryCount; i++) {
    if (referenceAngle(i, slice) > a) return i;
  }
  return 0;
}

double angleForPoint(const Point& p, const Point& center) {
  double dx = p.x - center.x;
  double dy = p.y - center.y;
  if (dx == 0.0 && dy == 0.0) return 0.0;
  return normalizeAngle(radToDeg(std::atan2(dy, dx)));
}

double distanceToCenter(const Point& p, const Point& center) {
  return distanceBetween(p, center);
}

} // namespace rc
