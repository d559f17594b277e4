#pragma once

#include <limits>

#include "durationstring.hpp"
#include "json-string-value.hpp"
#include "mdist_json-serialization.hpp"
#include "timedef.hpp"

namespace mdist::schema {

/// Duration serialized in JSON as a string like "1min30s".
struct Duration {
  auto operator<=>(const Duration &) const noexcept = default;

  ::mdist::Duration duration{};
};

}  // namespace mdist::schema

template <>
struct glz::meta<::mdist::schema::Duration> {
  static constexpr auto value{&::mdist::schema::Duration::duration};
};

namespace glz {
template <>
struct from<JSON, ::mdist::schema::Duration> {
  template <auto Opts, class It, class End>
  static void op(auto &&value, is_context auto &&, It &&it, End &&end) {
    value.duration = ::mdist::ParseDuration(::mdist::details::ReadJsonStringValue(it, end));
  }
};

template <>
struct to<JSON, ::mdist::schema::Duration> {
  template <auto Opts, is_context Ctx, class B, class IX>
  static void op(auto &&value, Ctx &&, B &&b, IX &&ix) {
    ::mdist::details::WriteJsonStringValue(
        ::mdist::DurationToString(value.duration, std::numeric_limits<int>::max()), b, ix);
  }
};
}  // namespace glz
