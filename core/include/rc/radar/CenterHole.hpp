#pragma once

namespace rc {

// Radius of the optional central cut-out. radiusPercent is not clamped:
// values above 1 give a hole larger than the web.
inline double holeRadius(double outerRadius, double radiusPercent) {
  return outerRadius * radiusPercent;
}

} // namespace rc
