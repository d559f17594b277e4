#pragma once

#include <cstdint>
#include <string_view>

#include "mdist_string.hpp"

namespace mdist {

/// A file located in a sub directory of the data directory, depending on its type.
class File {
 public:
  enum class Type : int8_t { kStatic, kLog };
  enum class IfError : int8_t { kThrow, kNoThrow };

  File(std::string_view dataDir, Type type, std::string_view name, IfError ifError);

  /// Read the full content of the file.
  /// If file does not exist and IfError is kNoThrow, an empty string is returned.
  string readAll() const;

  /// Write given data from start of the file, creating parent directories if needed.
  /// Returns the number of bytes written.
  int write(std::string_view data) const;

  bool exists() const;

  std::string_view path() const { return _filePath; }

 private:
  string _filePath;
  IfError _ifError;
};

}  // namespace mdist
