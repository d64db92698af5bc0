#include "rc/radar/OffsetEstimator.hpp"
#include "rc/math/Angle.hpp"
#include <cmath>

namespace rc {

double legendOffset(double legendFontPointSize) {
  return legendFontPointSize * 4.0;
}

double baseOffset(bool xAxisEnabled, bool xAxisLabelsEnabled, double rotatedLabelWidth) {
  return xAxisEnabled && xAxisLabelsEnabled ? rotatedLabelWidth : kDefaultBaseOffset;
}

double rotatedLabelWidth(double width, double height, double degrees) {
  double rad = degToRad(degrees);
  return std::fabs(width * std::cos(rad)) + std::fabs(height * std::sin(rad));
}

} // namespace rc
