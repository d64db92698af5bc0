#pragma once
#include "rc/chart/Highlight.hpp"
#include <vector>

namespace rc {

class RadarChart;

struct RadarHit {
  bool hit{false};
  Highlight highlight;
};

// Translates a pointer position into the highlighted vertex of a radar chart.
class RadarHighlighter {
public:
  explicit RadarHighlighter(const RadarChart& chart) : chart_(chart) {}

  // Misses when nothing is drawable or the pointer lies outside the web.
  // Otherwise resolves the slice under the pointer and returns the visible
  // series whose value is closest to the pointer's distance from center.
  RadarHit pick(double xPx, double yPx) const;

  // One candidate per visible series that has a value at `index`.
  std::vector<Highlight> highlightsForIndex(int index) const;

private:
  const RadarChart& chart_;
};

} // namespace rc
