// D1.5 — Center hole and layout offsets
// Tests: hole radius endpoints and monotonicity, unclamped percent,
// legend offset, base offset fallback, rotated label width.

#include "rc/radar/CenterHole.hpp"
#include "rc/radar/OffsetEstimator.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

int main() {
  // --- Test 1: hole radius ---
  {
    requireTrue(rc::holeRadius(120.0, 0.0) == 0.0, "0% -> 0");
    requireTrue(rc::holeRadius(120.0, 1.0) == 120.0, "100% -> outer radius");
    requireTrue(approx(rc::holeRadius(120.0, 0.5), 60.0), "50% -> 60");

    double prev = rc::holeRadius(120.0, 0.0);
    for (int i = 1; i <= 100; i++) {
      double r = rc::holeRadius(120.0, i / 100.0);
      requireTrue(r >= prev, "monotonically non-decreasing");
      prev = r;
    }

    requireTrue(approx(rc::holeRadius(120.0, 1.5), 180.0), "150% is not clamped");
    std::printf("  Test 1 (hole radius) PASS\n");
  }

  // --- Test 2: legend and base offsets ---
  {
    requireTrue(approx(rc::legendOffset(10.0), 40.0), "legend 10pt -> 40");
    requireTrue(approx(rc::baseOffset(true, true, 37.5), 37.5), "labels on -> label width");
    requireTrue(rc::baseOffset(false, true, 37.5) == rc::kDefaultBaseOffset, "axis off -> 10");
    requireTrue(rc::baseOffset(true, false, 37.5) == 10.0, "labels off -> 10");
    std::printf("  Test 2 (offsets) PASS\n");
  }

  // --- Test 3: rotated label width ---
  {
    requireTrue(approx(rc::rotatedLabelWidth(40.0, 12.0, 0.0), 40.0), "0 deg -> width");
    requireTrue(approx(rc::rotatedLabelWidth(40.0, 12.0, 90.0), 12.0), "90 deg -> height");
    double w45 = rc::rotatedLabelWidth(40.0, 12.0, 45.0);
    requireTrue(approx(w45, (40.0 + 12.0) * std::sqrt(0.5)), "45 deg");
    requireTrue(approx(rc::rotatedLabelWidth(40.0, 12.0, -30.0),
                       rc::rotatedLabelWidth(40.0, 12.0, 30.0)), "symmetric in sign");
    std::printf("  Test 3 (rotated label width) PASS\n");
  }

  std::printf("D1.5 hole and offsets: ALL PASS\n");
  return 0;
}
