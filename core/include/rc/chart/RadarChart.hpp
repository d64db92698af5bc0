#pragma once
#include "rc/chart/Highlight.hpp"
#include "rc/data/RadarData.hpp"
#include "rc/radar/RadialAxis.hpp"
#include "rc/radar/Types.hpp"
#include "rc/session/RadarConfig.hpp"

#include <vector>

namespace rc {

class RadarRenderer;

// Layout measurements supplied by the host's chart shell.
struct RadarLayout {
  Rect contentRect{0, 0, 0, 0};
  double legendFontPointSize{10.0};
  bool xAxisEnabled{true};
  bool xAxisLabelsEnabled{true};
  double xAxisLabelRotatedWidth{0};
};

// Radial geometry of one radar chart. Holds the configuration, the current
// dataset and the cached axis calibration. Any change of the dataset or of an
// axis override must be followed by notifyDataSetChanged(); the setters on
// this class do that themselves.
class RadarChart {
public:
  RadarChart() = default;
  explicit RadarChart(const RadarConfig& cfg);

  // ---- Configuration ----
  void setConfig(const RadarConfig& cfg);
  const RadarConfig& config() const { return config_; }

  void setSkipWebLineCount(int count);
  int skipWebLineCount() const { return config_.skipWebLineCount; }
  void setHoleRadiusPercent(double percent) { config_.holeRadiusPercent = percent; }
  void setDrawHoleEnabled(bool enabled) { config_.drawHoleEnabled = enabled; }
  void setDrawWeb(bool enabled) { config_.drawWeb = enabled; }
  void setWebLineWidth(double w) { config_.webLineWidth = w; }
  void setRotationDegrees(double deg) { config_.rotationDegrees = deg; }
  double rotationDegrees() const { return config_.rotationDegrees; }

  void setAxisMinimum(double v);
  void setAxisMaximum(double v);
  void resetAxisMinimum();
  void resetAxisMaximum();

  // ---- Data ----
  void setData(const RadarData& data);
  const RadarData& data() const { return data_; }
  bool setSeriesVisible(std::size_t series, bool visible);

  // Recalibrate the axis and ring levels from the current dataset.
  void notifyDataSetChanged();

  // ---- Layout ----
  void setLayout(const RadarLayout& layout) { layout_ = layout; }
  const RadarLayout& layout() const { return layout_; }
  void setContentRect(const Rect& r) { layout_.contentRect = r; }
  const Rect& contentRect() const { return layout_.contentRect; }

  // ---- Derived geometry ----
  // False when there are no entries or the axis range is zero or overflows.
  bool hasDrawableData() const;

  int entryCount() const { return data_.entryCount(); }
  double sliceAngle() const;
  double factor() const;
  double radius() const;
  Point center() const;

  const AxisRange& axisRange() const { return axis_.axisRange(); }
  double chartYMin() const { return axis_.axisRange().minimum; }
  double chartYMax() const { return axis_.axisRange().maximum; }
  double yRange() const { return axis_.axisRange().range(); }
  const std::vector<double>& ringLevels() const { return rings_; }

  Point pointForEntry(int index, double value) const;
  Point labelAnchor(int index) const;
  int indexForAngle(double absoluteAngleDegrees) const;

  double requiredLegendOffset() const;
  double requiredBaseOffset() const;
  double webLineHoleRadius() const;
  double holeRadius() const;

  // ---- Highlights ----
  void highlightValues(const std::vector<Highlight>& highlights) { highlights_ = highlights; }
  void clearHighlights() { highlights_.clear(); }
  const std::vector<Highlight>& highlights() const { return highlights_; }
  bool valuesToHighlight() const { return !highlights_.empty(); }

  void draw(RadarRenderer& renderer) const;

private:
  RadarConfig config_;
  RadarLayout layout_;
  RadarData data_;
  RadialAxisCalibrator axis_;
  std::vector<double> rings_;
  std::vector<Highlight> highlights_;

  void applyAxisConfig();
};

} // namespace rc
