#pragma once

#include <cstdint>

#include "json-string-value.hpp"
#include "mdist_json-serialization.hpp"
#include "unitsparser.hpp"

namespace mdist::schema {

/// Number of bytes serialized in JSON as a string like "5Mi".
struct SizeBytes {
  auto operator<=>(const SizeBytes &) const noexcept = default;

  int64_t sizeInBytes{};
};

}  // namespace mdist::schema

template <>
struct glz::meta<::mdist::schema::SizeBytes> {
  static constexpr auto value{&::mdist::schema::SizeBytes::sizeInBytes};
};

namespace glz {
template <>
struct from<JSON, ::mdist::schema::SizeBytes> {
  template <auto Opts, class It, class End>
  static void op(auto &&value, is_context auto &&, It &&it, End &&end) {
    value.sizeInBytes = ::mdist::ParseNumberOfBytes(::mdist::details::ReadJsonStringValue(it, end));
  }
};

template <>
struct to<JSON, ::mdist::schema::SizeBytes> {
  template <auto Opts, is_context Ctx, class B, class IX>
  static void op(auto &&value, Ctx &&, B &&b, IX &&ix) {
    ::mdist::details::WriteJsonStringValue(::mdist::BytesToStr(value.sizeInBytes), b, ix);
  }
};
}  // namespace glz
