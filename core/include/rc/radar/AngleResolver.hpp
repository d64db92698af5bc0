#pragma once
#include "rc/radar/Types.hpp"

namespace rc {

// Inverse of pointForEntry's angular part. Normalizes
// a = (absoluteAngle - rotation) into [0, 360) and returns the first index i
// whose reference angle slice*(i+1) - slice/2 is strictly greater than a.
// Falls back to 0 for the wrap-around region of the last slice and when
// entryCount <= 0.
int indexForAngle(double absoluteAngleDegrees, double rotationDegrees, int entryCount);

// Reference (upper boundary) angle of slice `index`, relative to rotation.
double referenceAngle(int index, double sliceAngle);

// Absolute angle of `p` around `center` in [0, 360), same convention as
// pointForEntry (y-down, 0 deg = +x, clockwise).
double angleForPoint(const Point& p, const Point& center);

double distanceToCenter(const Point& p, const Point& center);

} // namespace rc
