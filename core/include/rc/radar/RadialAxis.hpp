#pragma once
#include "rc/radar/Types.hpp"

namespace rc {

struct RadialAxisConfig {
  bool hasForcedMinimum{false};
  double forcedMinimum{0};
  bool hasForcedMaximum{false};
  double forcedMaximum{0};
  double spaceTopPercent{0};     // extra headroom above data max, in % of range
  double spaceBottomPercent{0};  // extra room below data min, in % of range
};

// Calibrates the radial (value) axis of a radar chart. Only the left axis
// side is used. The cached range is replaced on every calibrate() call.
class RadialAxisCalibrator {
public:
  void setConfig(const RadialAxisConfig& cfg) { config_ = cfg; }
  const RadialAxisConfig& config() const { return config_; }

  void setForcedMinimum(double v);
  void setForcedMaximum(double v);
  void resetForcedMinimum();
  void resetForcedMaximum();

  // Forced sides win over the observed extrema. An empty dataset is
  // calibrated as calibrate(0, 0).
  AxisRange calibrate(double dataMin, double dataMax);

  const AxisRange& axisRange() const { return range_; }

  // min(width, height) / 2 / range. Returns 0 when range <= 0; callers
  // treat that as "nothing to draw".
  static double scaleFactor(const Rect& contentRect, const AxisRange& range);

private:
  RadialAxisConfig config_;
  AxisRange range_;
};

} // namespace rc
