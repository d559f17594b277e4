#pragma once

#include "mdist_exception.hpp"
#include "mdist_json-serialization.hpp"
#include "mdist_string.hpp"

namespace mdist {

/// JSON representation of 'obj', one field per line and indented with 2 spaces.
string WritePrettyJsonOrThrow(const auto &obj) {
  static constexpr json::opts kPrettyJsonOptions{.prettify = true,        // NOLINT(readability-implicit-bool-conversion)
                                                 .indentation_width = 2,  // NOLINT(readability-implicit-bool-conversion)
                                                 .raw_string = true};     // NOLINT(readability-implicit-bool-conversion)
  string jsonContent;
  if (const auto ec = json::write<kPrettyJsonOptions>(obj, jsonContent)) {
    throw exception("Unable to write JSON content: {}", json::format_error(ec, jsonContent));
  }
  return jsonContent;
}

}  // namespace mdist
