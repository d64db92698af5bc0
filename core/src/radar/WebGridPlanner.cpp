#include "rc/radar/WebGridPlanner.hpp"
#include "rc/math/NiceTicks.hpp"

#include <algorithm>
#include <cmath>

namespace rc {

bool isSpokeEligible(int index, int skipCount) {
  if (skipCount <= 0) return true;
  return index % (skipCount + 1) == 0;
}

std::vector<int> eligibleSpokes(int entryCount, int skipCount) {
  std::vector<int> out;
  for (int i = 0; i < entryCount; i++) {
    if (isSpokeEligible(i, skipCount)) out.push_back(i);
  }
  return out;
}

double innerLineHoleRadius(double webLineWidth) {
  return webLineWidth * 3.0;
}

std::vector<double> ringLevels(const AxisRange& axis, int labelCount) {
  double r = axis.range();
  if (!(r > 0.0) || !std::isfinite(r)) return {};
  labelCount = std::max(1, std::min(labelCount, kMaxRingLabelCount));
  return computeNiceTicks(axis.minimum, axis.maximum, labelCount).values;
}

} // namespace rc
