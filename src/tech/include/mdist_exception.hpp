#pragma once

#include <array>
#include <cstddef>
#include <exception>
#include <string_view>
#include <utility>

#include "mdist_format.hpp"

namespace mdist {

/// Exception keeping its message in an inline buffer, so that building it never allocates.
/// Messages longer than kMsgMaxLen chars are truncated, their last chars being replaced by "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 119;

  template <class... Args>
  explicit exception(format_string<Args...> fmt, Args&&... args) {
    const auto [end, size] = mdist::format_to_n(_msg.data(), kMsgMaxLen, fmt, std::forward<Args>(args)...);
    *end = '\0';
    if (size > kMsgMaxLen) {
      kTruncationMark.copy(_msg.data() + kMsgMaxLen - kTruncationMark.size(), kTruncationMark.size());
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _msg.data(); }

 private:
  static constexpr std::string_view kTruncationMark = "...";

  std::array<char, kMsgMaxLen + 1> _msg;
};

}  // namespace mdist
