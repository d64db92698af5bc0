#include "rc/data/RadarData.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace rc {

std::size_t RadarData::addSeries(const RadarSeries& series) {
  series_.push_back(series);
  return series_.size() - 1;
}

void RadarData::clear() {
  series_.clear();
  labels_.clear();
}

bool RadarData::setSeriesVisible(std::size_t i, bool visible) {
  if (i >= series_.size()) return false;
  series_[i].visible = visible;
  return true;
}

int RadarData::entryCount() const {
  std::size_t n = 0;
  for (const auto& s : series_) n = std::max(n, s.values.size());
  return static_cast<int>(n);
}

bool RadarData::extrema(double& lo, double& hi) const {
  lo = std::numeric_limits<double>::max();
  hi = std::numeric_limits<double>::lowest();
  bool found = false;

  for (const auto& s : series_) {
    if (!s.visible) continue;
    for (double v : s.values) {
      if (!std::isfinite(v)) continue;
      lo = std::min(lo, v);
      hi = std::max(hi, v);
      found = true;
    }
  }
  return found;
}

double RadarData::valueMin() const {
  double lo, hi;
  return extrema(lo, hi) ? lo : 0.0;
}

double RadarData::valueMax() const {
  double lo, hi;
  return extrema(lo, hi) ? hi : 0.0;
}

bool RadarData::hasVisibleValues() const {
  double lo, hi;
  return extrema(lo, hi);
}

} // namespace rc
