#include "rc/radar/RadialAxis.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace rc {

namespace {

// Widen `bound` by `pad`, saturating at the largest finite double.
double padBound(double bound, double pad) {
  double v = bound + pad;
  if (std::isnan(v)) return bound;
  if (std::isinf(v)) {
    return v > 0 ? std::numeric_limits<double>::max()
                 : std::numeric_limits<double>::lowest();
  }
  return v;
}

// |hi - lo| * p without forming the span, which can overflow for finite bounds.
double scaledSpan(double hi, double lo, double p) {
  return hi >= lo ? hi * p - lo * p : lo * p - hi * p;
}

double finiteOr(double v, double fallback) {
  return std::isfinite(v) ? v : fallback;
}

} // namespace

void RadialAxisCalibrator::setForcedMinimum(double v) {
  config_.hasForcedMinimum = true;
  config_.forcedMinimum = v;
}

void RadialAxisCalibrator::setForcedMaximum(double v) {
  config_.hasForcedMaximum = true;
  config_.forcedMaximum = v;
}

void RadialAxisCalibrator::resetForcedMinimum() {
  config_.hasForcedMinimum = false;
  config_.forcedMinimum = 0;
}

void RadialAxisCalibrator::resetForcedMaximum() {
  config_.hasForcedMaximum = false;
  config_.forcedMaximum = 0;
}

AxisRange RadialAxisCalibrator::calibrate(double dataMin, double dataMax) {
  dataMin = finiteOr(dataMin, 0.0);
  dataMax = finiteOr(dataMax, 0.0);
  double lo = config_.hasForcedMinimum ? finiteOr(config_.forcedMinimum, dataMin) : dataMin;
  double hi = config_.hasForcedMaximum ? finiteOr(config_.forcedMaximum, dataMax) : dataMax;

  const double top = config_.spaceTopPercent / 100.0;
  const double bottom = config_.spaceBottomPercent / 100.0;
  const double hi0 = hi, lo0 = lo;
  if (!config_.hasForcedMaximum && top != 0.0 && std::isfinite(top))
    hi = padBound(hi0, scaledSpan(hi0, lo0, top));
  if (!config_.hasForcedMinimum && bottom != 0.0 && std::isfinite(bottom))
    lo = padBound(lo0, -scaledSpan(hi0, lo0, bottom));

  // An override crossing the data collapses the axis instead of inverting it.
  if (hi < lo) {
    if (config_.hasForcedMinimum && !config_.hasForcedMaximum) hi = lo;
    else lo = hi;
  }

  range_.minimum = lo;
  range_.maximum = hi;
  return range_;
}

double RadialAxisCalibrator::scaleFactor(const Rect& contentRect, const AxisRange& range) {
  double r = range.range();
  if (!(r > 0.0) || !std::isfinite(r)) return 0.0;
  return std::min(contentRect.width, contentRect.height) / 2.0 / r;
}

} // namespace rc
