#pragma once
#include "rc/chart/Highlight.hpp"
#include <vector>

namespace rc {

class RadarChart;

// Capability set a host supplies to paint a radar chart. RadarChart::draw
// calls drawExtras (web, hole), then drawData, then drawHighlighted.
class RadarRenderer {
public:
  virtual ~RadarRenderer() = default;

  virtual void drawExtras(const RadarChart& chart) = 0;
  virtual void drawData(const RadarChart& chart) = 0;
  virtual void drawHighlighted(const RadarChart& chart,
                               const std::vector<Highlight>& highlights) = 0;
};

} // namespace rc
