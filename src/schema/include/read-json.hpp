#pragma once

#include <string_view>

#include "file.hpp"
#include "mdist_exception.hpp"
#include "mdist_json-serialization.hpp"
#include "write-json.hpp"

namespace mdist {

/// Fills 'outObject' from given JSON content. Fields absent from the JSON content keep their current value, and
/// empty content leaves 'outObject' unchanged.
/// Throws exception for invalid JSON and for keys unknown to the schema of 'outObject'.
void ReadExactJsonOrThrow(std::string_view jsonContent, auto &outObject) {
  static constexpr json::opts kExactJsonOptions{.error_on_unknown_keys = true,  // NOLINT(readability-implicit-bool-conversion)
                                                .raw_string = true};            // NOLINT(readability-implicit-bool-conversion)
  if (jsonContent.empty()) {
    return;
  }
  if (const auto ec = json::read<kExactJsonOptions>(outObject, jsonContent)) {
    throw exception("Invalid JSON content: {}", json::format_error(ec, jsonContent));
  }
}

/// Reads an object of type T from given JSON file.
/// If the file does not exist, it is created with the default values of T, which are returned.
template <class T>
T ReadJsonOrCreateFile(const File &file) {
  T ret;
  if (file.exists()) {
    ReadExactJsonOrThrow(file.readAll(), ret);
  } else {
    file.write(WritePrettyJsonOrThrow(ret));
  }
  return ret;
}

}  // namespace mdist
