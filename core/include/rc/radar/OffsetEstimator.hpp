#pragma once

namespace rc {

// Inset fallback when category labels are not drawn.
inline constexpr double kDefaultBaseOffset = 10.0;

// Minimum inset reserved for the legend: fontPointSize * 4.
double legendOffset(double legendFontPointSize);

// Inset needed for category labels: the rotated label width when the x axis
// and its labels are enabled, kDefaultBaseOffset otherwise.
double baseOffset(bool xAxisEnabled, bool xAxisLabelsEnabled, double rotatedLabelWidth);

// Width of the bounding box of a width x height label rotated by `degrees`.
double rotatedLabelWidth(double width, double height, double degrees);

} // namespace rc
