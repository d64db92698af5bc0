#pragma once
#include <string>

namespace rc {

// Serializable radar chart options.
struct RadarConfig {
  std::string version{"1.0"};

  // Web
  bool drawWeb{true};
  int skipWebLineCount{0};          // spokes skipped between drawn ones, >= 0
  double webLineWidth{1.5};
  double innerWebLineWidth{0.75};
  double webAlpha{150.0 / 255.0};
  int ringLabelCount{6};            // 1..25

  // Center hole
  bool drawHoleEnabled{true};
  double holeRadiusPercent{0.5};    // fraction of the outer radius, unclamped

  // Radial axis overrides
  bool hasAxisMinimum{false};
  double axisMinimum{0};
  bool hasAxisMaximum{false};
  double axisMaximum{0};
  double spaceTopPercent{0};
  double spaceBottomPercent{0};

  // 270 puts slice 0 at twelve o'clock on a y-down surface.
  double rotationDegrees{270.0};
};

// Clamp skip count to >= 0 and ring count to [1, kMaxRingLabelCount].
RadarConfig sanitizeRadarConfig(const RadarConfig& cfg);

std::string serializeRadarConfig(const RadarConfig& cfg);

// Deserialize a JSON string into `out`. Keys that are missing or of the
// wrong type keep their current value. Returns false on a parse error.
bool deserializeRadarConfig(const std::string& json, RadarConfig& out);

} // namespace rc
