#include "rc/chart/RadarHighlighter.hpp"
#include "rc/chart/RadarChart.hpp"
#include "rc/radar/AngleResolver.hpp"

#include <cmath>
#include <limits>

namespace rc {

std::vector<Highlight> RadarHighlighter::highlightsForIndex(int index) const {
  std::vector<Highlight> out;
  if (index < 0) return out;

  const RadarData& data = chart_.data();
  for (std::size_t i = 0; i < data.seriesCount(); i++) {
    const RadarSeries& s = data.series(i);
    if (!s.visible) continue;
    if (static_cast<std::size_t>(index) >= s.values.size()) continue;

    double v = s.values[static_cast<std::size_t>(index)];
    if (!std::isfinite(v)) continue;

    Point p = chart_.pointForEntry(index, v);
    Highlight h;
    h.entryIndex = index;
    h.dataSetIndex = i;
    h.value = v;
    h.xPx = p.x;
    h.yPx = p.y;
    out.push_back(h);
  }
  return out;
}

RadarHit RadarHighlighter::pick(double xPx, double yPx) const {
  RadarHit best;
  if (!chart_.hasDrawableData() || !(chart_.factor() > 0.0)) return best;

  Point pointer{xPx, yPx};
  Point c = chart_.center();
  double dist = distanceToCenter(pointer, c);
  if (dist > chart_.radius()) return best;

  int index = chart_.indexForAngle(angleForPoint(pointer, c));

  // Value the pointer would represent at its distance from center
  double pointerValue = dist / chart_.factor() + chart_.chartYMin();

  double bestDelta = std::numeric_limits<double>::max();
  for (const Highlight& h : highlightsForIndex(index)) {
    double delta = std::fabs(h.value - pointerValue);
    if (delta < bestDelta) {
      bestDelta = delta;
      best.hit = true;
      best.highlight = h;
    }
  }

  return best;
}

} // namespace rc
