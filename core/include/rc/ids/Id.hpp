#pragma once
#include <cstdint>

namespace rc {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

} // namespace rc
