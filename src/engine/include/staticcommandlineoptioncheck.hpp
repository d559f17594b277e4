#pragma once

#include <cstddef>
#include <string_view>

#include "commandlineoption.hpp"

namespace mdist {

/// Compile time check that no two options share the same long name or the same short name.
template <class Opts, std::size_t N>
consteval bool AreOptionNamesUnique(const OptionDef<Opts> (&defs)[N]) {
  for (std::size_t lhsPos = 0; lhsPos < N; ++lhsPos) {
    const CommandLineOption &lhs = defs[lhsPos].option;
    for (std::size_t rhsPos = lhsPos + 1; rhsPos < N; ++rhsPos) {
      const CommandLineOption &rhs = defs[rhsPos].option;
      if (lhs.longName == rhs.longName || (lhs.shortName != '\0' && lhs.shortName == rhs.shortName)) {
        return false;
      }
    }
  }
  return true;
}

/// Compile time check that long names start with "--" and that descriptions are not empty and do not start nor end
/// with a space or a new line.
template <class Opts, std::size_t N>
consteval bool AreOptionsWellFormed(const OptionDef<Opts> (&defs)[N]) {
  const auto isBlank = [](char ch) { return ch == ' ' || ch == '\n'; };
  for (const auto &def : defs) {
    const CommandLineOption &option = def.option;
    if (option.longName.size() < 3 || !option.longName.starts_with("--")) {
      return false;
    }
    if (option.description.empty() || isBlank(option.description.front()) || isBlank(option.description.back())) {
      return false;
    }
  }
  return true;
}

}  // namespace mdist
