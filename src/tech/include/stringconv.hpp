#pragma once

#include <charconv>
#include <concepts>
#include <limits>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "mdist_config.hpp"
#include "mdist_exception.hpp"
#include "mdist_string.hpp"

namespace mdist {

namespace details {
template <std::integral Int>
constexpr int MaxNbChars() {
  // +1 for the minus sign of signed types, +1 for the partial last digit
  return std::numeric_limits<Int>::digits10 + 1 + (std::is_signed_v<Int> ? 1 : 0);
}
}  // namespace details

inline void AppendIntegralToString(string &str, std::integral auto val) {
  char buf[details::MaxNbChars<decltype(val)>()];
  const auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), val);
  if (MDIST_UNLIKELY(errc != std::errc())) {
    throw exception("Unable to decode integral into string");
  }
  str.append(buf, ptr);
}

template <std::integral Integral = int>
Integral StringToIntegral(std::string_view str) {
  // No need to value initialize ret, std::from_chars will set it in case no error is returned
  // And in case of error, exception is thrown instead
  Integral ret;

  const char *begPtr = str.data();
  const char *endPtr = begPtr + str.size();
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret);

  if (errc != std::errc()) {
    if (errc == std::errc::result_out_of_range) {
      throw exception("'{}' would produce an out of range integral", str);
    }
    throw exception("Unable to decode '{}' into integral", str);
  }

  if (ptr != endPtr) {
    throw exception("Only {} out of {} chars decoded into integral {}", ptr - begPtr, str.size(), ret);
  }
  return ret;
}

}  // namespace mdist
