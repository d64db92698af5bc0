#pragma once
#include "rc/radar/Types.hpp"

namespace rc {

// Angular width of one category slice: 360 / entryCount.
// entryCount <= 0 returns 0; callers skip drawing in that state.
double sliceAngleDegrees(int entryCount);

// Outer radius of the web: the shorter half-dimension of the content rect.
double outerRadius(const Rect& contentRect);
Point contentCenter(const Rect& contentRect);

// Forward mapping (category index, value) -> absolute screen point.
//   radius = (value - axis.minimum) * scaleFactor
//   angle  = sliceAngle * index + rotation
// Screen space is y-down, 0 deg points to +x and angles grow clockwise.
Point pointForEntry(int index, double value, const Point& center,
                    const AxisRange& axis, double scaleFactor,
                    double rotationDegrees, double sliceAngle);

// Anchor for the category label of slice `index`, just outside the web.
Point labelAnchor(int index, const Point& center, const AxisRange& axis,
                  double scaleFactor, double rotationDegrees, double sliceAngle,
                  double labelRotatedWidth);

} // namespace rc
