#pragma once
#include <vector>

namespace rc {

struct TickSet {
  double step{0};
  std::vector<double> values;
};

// Compute "nice" tick values that lie inside [lo, hi].
// Snaps step to {1, 2, 2.5, 5, 10} x 10^n. Unlike a cartesian axis the
// range is not widened to the next step: radar rings must stay inside the web.
TickSet computeNiceTicks(double lo, double hi, int targetCount = 5);

} // namespace rc
