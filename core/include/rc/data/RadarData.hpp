#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace rc {

// One overlaid series: one value per category.
struct RadarSeries {
  std::string name;
  std::vector<double> values;
  float colorHint[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  bool visible{true};
};

// In-process dataset. Categories are shared by all series; the number of
// slices is the length of the longest series.
class RadarData {
public:
  RadarData() = default;
  explicit RadarData(std::vector<std::string> categoryLabels)
    : labels_(std::move(categoryLabels)) {}

  std::size_t addSeries(const RadarSeries& series);
  void clear();

  std::size_t seriesCount() const { return series_.size(); }
  const RadarSeries& series(std::size_t i) const { return series_[i]; }
  const std::vector<RadarSeries>& allSeries() const { return series_; }

  // Returns false for an unknown series index.
  bool setSeriesVisible(std::size_t i, bool visible);

  const std::vector<std::string>& categoryLabels() const { return labels_; }
  void setCategoryLabels(std::vector<std::string> labels) { labels_ = std::move(labels); }

  int entryCount() const;

  // Extrema over visible series. Both are 0 when no visible value exists.
  double valueMin() const;
  double valueMax() const;
  bool hasVisibleValues() const;

private:
  std::vector<std::string> labels_;
  std::vector<RadarSeries> series_;

  bool extrema(double& lo, double& hi) const;
};

} // namespace rc
