#pragma once

#include <concepts>
#include <limits>

namespace mdist {

/// Tells whether lhs + rhs would overflow T.
template <std::signed_integral T>
constexpr bool WillSumOverflow(T lhs, T rhs) {
  if (rhs > 0) {
    return lhs > std::numeric_limits<T>::max() - rhs;
  }
  return lhs < std::numeric_limits<T>::min() - rhs;
}

/// Tells whether lhs * rhs would overflow T, for non negative operands only.
template <std::signed_integral T>
constexpr bool WillNonNegativeProductOverflow(T lhs, T rhs) {
  return rhs != 0 && lhs > std::numeric_limits<T>::max() / rhs;
}

}  // namespace mdist
