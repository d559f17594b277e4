#pragma once

#include <algorithm>
#include <string_view>

#include "mdist_cctype.hpp"
#include "mdist_string.hpp"

namespace mdist {

inline string ToUpper(std::string_view str) {
  string ret(str);
  std::ranges::transform(ret, ret.begin(), [](char ch) { return toupper(ch); });
  return ret;
}

}  // namespace mdist
