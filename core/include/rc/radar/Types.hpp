#pragma once

namespace rc {

struct Point {
  double x{0}, y{0};
};

// Content rectangle in the chart's local coordinate space (y-down).
struct Rect {
  double x{0}, y{0};
  double width{0}, height{0};

  double midX() const { return x + width * 0.5; }
  double midY() const { return y + height * 0.5; }
};

// Calibrated radial (value) axis. maximum >= minimum.
struct AxisRange {
  double minimum{0};
  double maximum{0};

  double range() const { return maximum - minimum; }
};

} // namespace rc
