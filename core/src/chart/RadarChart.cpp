#include "rc/chart/RadarChart.hpp"
#include "rc/chart/RadarRenderer.hpp"
#include "rc/radar/AngleResolver.hpp"
#include "rc/radar/CenterHole.hpp"
#include "rc/radar/OffsetEstimator.hpp"
#include "rc/radar/SliceGeometry.hpp"
#include "rc/radar/WebGridPlanner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace rc {

RadarChart::RadarChart(const RadarConfig& cfg) {
  setConfig(cfg);
}

void RadarChart::setConfig(const RadarConfig& cfg) {
  config_ = sanitizeRadarConfig(cfg);
  applyAxisConfig();
  notifyDataSetChanged();
}

void RadarChart::applyAxisConfig() {
  RadialAxisConfig ac;
  ac.hasForcedMinimum = config_.hasAxisMinimum;
  ac.forcedMinimum = config_.axisMinimum;
  ac.hasForcedMaximum = config_.hasAxisMaximum;
  ac.forcedMaximum = config_.axisMaximum;
  ac.spaceTopPercent = config_.spaceTopPercent;
  ac.spaceBottomPercent = config_.spaceBottomPercent;
  axis_.setConfig(ac);
}

void RadarChart::setSkipWebLineCount(int count) {
  config_.skipWebLineCount = std::max(0, count);
}

void RadarChart::setAxisMinimum(double v) {
  config_.hasAxisMinimum = true;
  config_.axisMinimum = v;
  applyAxisConfig();
  notifyDataSetChanged();
}

void RadarChart::setAxisMaximum(double v) {
  config_.hasAxisMaximum = true;
  config_.axisMaximum = v;
  applyAxisConfig();
  notifyDataSetChanged();
}

void RadarChart::resetAxisMinimum() {
  config_.hasAxisMinimum = false;
  config_.axisMinimum = 0;
  applyAxisConfig();
  notifyDataSetChanged();
}

void RadarChart::resetAxisMaximum() {
  config_.hasAxisMaximum = false;
  config_.axisMaximum = 0;
  applyAxisConfig();
  notifyDataSetChanged();
}

void RadarChart::setData(const RadarData& data) {
  data_ = data;
  highlights_.clear();
  notifyDataSetChanged();
}

bool RadarChart::setSeriesVisible(std::size_t series, bool visible) {
  if (!data_.setSeriesVisible(series, visible)) return false;
  if (!visible) {
    highlights_.erase(std::remove_if(highlights_.begin(), highlights_.end(),
                                     [series](const Highlight& h) {
                                       return h.dataSetIndex == series;
                                     }),
                      highlights_.end());
  }
  notifyDataSetChanged();
  return true;
}

void RadarChart::notifyDataSetChanged() {
  if (data_.entryCount() == 0) {
    axis_.calibrate(0.0, 0.0);
  } else {
    axis_.calibrate(data_.valueMin(), data_.valueMax());
  }
  rings_ = rc::ringLevels(axis_.axisRange(), config_.ringLabelCount);

  if (data_.seriesCount() > 0 && data_.entryCount() == 0) {
    std::fprintf(stderr, "[RadarChart] dataset has %zu series but no entries\n",
                 data_.seriesCount());
  } else if (data_.entryCount() > 0 && !(yRange() > 0.0)) {
    std::fprintf(stderr, "[RadarChart] zero axis range at %g, nothing to draw\n",
                 chartYMin());
  } else if (data_.entryCount() > 0 && !std::isfinite(yRange())) {
    std::fprintf(stderr, "[RadarChart] axis range [%g, %g] overflows, nothing to draw\n",
                 chartYMin(), chartYMax());
  }
}

bool RadarChart::hasDrawableData() const {
  return entryCount() > 0 && yRange() > 0.0 && std::isfinite(yRange());
}

double RadarChart::sliceAngle() const {
  return sliceAngleDegrees(entryCount());
}

double RadarChart::factor() const {
  return RadialAxisCalibrator::scaleFactor(layout_.contentRect, axis_.axisRange());
}

double RadarChart::radius() const {
  return outerRadius(layout_.contentRect);
}

Point RadarChart::center() const {
  return contentCenter(layout_.contentRect);
}

Point RadarChart::pointForEntry(int index, double value) const {
  return rc::pointForEntry(index, value, center(), axis_.axisRange(), factor(),
                           config_.rotationDegrees, sliceAngle());
}

Point RadarChart::labelAnchor(int index) const {
  return rc::labelAnchor(index, center(), axis_.axisRange(), factor(),
                         config_.rotationDegrees, sliceAngle(),
                         layout_.xAxisLabelRotatedWidth);
}

int RadarChart::indexForAngle(double absoluteAngleDegrees) const {
  return rc::indexForAngle(absoluteAngleDegrees, config_.rotationDegrees, entryCount());
}

double RadarChart::requiredLegendOffset() const {
  return legendOffset(layout_.legendFontPointSize);
}

double RadarChart::requiredBaseOffset() const {
  return baseOffset(layout_.xAxisEnabled, layout_.xAxisLabelsEnabled,
                    layout_.xAxisLabelRotatedWidth);
}

double RadarChart::webLineHoleRadius() const {
  return innerLineHoleRadius(config_.webLineWidth);
}

double RadarChart::holeRadius() const {
  return rc::holeRadius(radius(), config_.holeRadiusPercent);
}

void RadarChart::draw(RadarRenderer& renderer) const {
  if (!hasDrawableData()) return;

  if (config_.drawWeb) renderer.drawExtras(*this);
  renderer.drawData(*this);
  if (valuesToHighlight()) renderer.drawHighlighted(*this, highlights_);
}

} // namespace rc
