#pragma once
#include "rc/radar/Types.hpp"
#include <vector>

namespace rc {

inline constexpr int kMaxRingLabelCount = 25;

// A spoke is a candidate for drawing when skipCount == 0 or index is a
// multiple of skipCount + 1. The renderer applies its own styling on top.
bool isSpokeEligible(int index, int skipCount);

// All eligible spoke indices in [0, entryCount).
std::vector<int> eligibleSpokes(int entryCount, int skipCount);

// Radius of the bullet drawn at the end of each web spoke.
double innerLineHoleRadius(double webLineWidth);

// Values of the concentric web rings, "nice" ticks inside the axis range.
// labelCount is clamped to [1, kMaxRingLabelCount]. Empty when the range is
// zero or not representable as a double.
std::vector<double> ringLevels(const AxisRange& axis, int labelCount);

} // namespace rc
