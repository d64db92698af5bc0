#include "rc/radar/SliceGeometry.hpp"
#include "rc/math/Angle.hpp"
#include <algorithm>

namespace rc {

double sliceAngleDegrees(int entryCount) {
  if (entryCount <= 0) return 0.0;
  return 360.0 / static_cast<double>(entryCount);
}

double outerRadius(const Rect& contentRect) {
  return std::min(contentRect.width / 2.0, contentRect.height / 2.0);
}

Point contentCenter(const Rect& contentRect) {
  return Point{contentRect.midX(), contentRect.midY()};
}

Point pointForEntry(int index, double value, const Point& center,
                    const AxisRange& axis, double scaleFactor,
                    double rotationDegrees, double sliceAngle) {
  double radius = (value - axis.minimum) * scaleFactor;
  double angle = sliceAngle * static_cast<double>(index) + rotationDegrees;
  return movePoint(center, radius, angle);
}

Point labelAnchor(int index, const Point& center, const AxisRange& axis,
                  double scaleFactor, double rotationDegrees, double sliceAngle,
                  double labelRotatedWidth) {
  double distance = axis.range() * scaleFactor + labelRotatedWidth / 2.0;
  double angle = sliceAngle * static_cast<double>(index) + rotationDegrees;
  return movePoint(center, distance, angle);
}

} // namespace rc
