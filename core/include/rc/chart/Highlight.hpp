#pragma once
#include <cstddef>

namespace rc {

// One highlighted vertex: category `entryIndex` of series `dataSetIndex`.
struct Highlight {
  int entryIndex{0};
  std::size_t dataSetIndex{0};
  double value{0};
  double xPx{0}, yPx{0};

  bool operator==(const Highlight& o) const {
    return entryIndex == o.entryIndex && dataSetIndex == o.dataSetIndex;
  }
  bool operator!=(const Highlight& o) const { return !(*this == o); }
};

} // namespace rc
