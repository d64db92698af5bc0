#include "rc/math/NiceTicks.hpp"
#include <cmath>
#include <cstddef>

namespace rc {

TickSet computeNiceTicks(double lo, double hi, int targetCount) {
  TickSet result;
  if (targetCount < 1) targetCount = 1;
  if (!(hi > lo)) {
    result.step = 0.0;
    return result;
  }

  double range = hi - lo;
  if (!std::isfinite(range)) return result;
  double rawStep = range / static_cast<double>(targetCount);

  double mag = std::pow(10.0, std::floor(std::log10(rawStep)));
  double residual = rawStep / mag;

  double niceStep;
  if (residual <= 1.0)       niceStep = 1.0 * mag;
  else if (residual <= 2.0)  niceStep = 2.0 * mag;
  else if (residual <= 2.5)  niceStep = 2.5 * mag;
  else if (residual <= 5.0)  niceStep = 5.0 * mag;
  else                       niceStep = 10.0 * mag;

  if (!std::isfinite(niceStep) || !(niceStep > 0.0)) return result;

  double eps = niceStep * 1e-6;
  double first = std::ceil((lo - eps) / niceStep) * niceStep;
  if (!std::isfinite(first)) return result;

  result.step = niceStep;

  // Index-based stepping keeps accumulated error out of the values.
  // At most targetCount + 1 ticks land in range.
  const std::size_t maxTicks = static_cast<std::size_t>(targetCount) * 4;
  for (std::size_t i = 0; i < maxTicks; i++) {
    double v = first + niceStep * static_cast<double>(i);
    if (v > hi + eps) break;
    if (std::fabs(v) < eps) v = 0.0;
    result.values.push_back(v);
  }

  return result;
}

} // namespace rc
