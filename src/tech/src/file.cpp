#include "file.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

#include "mdist_exception.hpp"
#include "mdist_log.hpp"
#include "mdist_string.hpp"

namespace mdist {

namespace {

constexpr std::string_view SubDirectory(File::Type type) {
  switch (type) {
    case File::Type::kStatic:
      return "static";
    case File::Type::kLog:
      return "log";
  }
  return "";
}

}  // namespace

File::File(std::string_view dataDir, Type type, std::string_view name, IfError ifError) : _ifError(ifError) {
  _filePath.append(dataDir).append("/").append(SubDirectory(type)).append("/").append(name);
}

bool File::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(_filePath, ec);
}

string File::readAll() const {
  if (_ifError == IfError::kNoThrow && !exists()) {
    log::debug("{} does not exist, considered empty", _filePath);
    return {};
  }
  log::debug("Reading {}", _filePath);
  std::ifstream inputStream(_filePath);
  if (!inputStream) {
    throw exception("Unable to open {} for reading", _filePath);
  }
  std::ostringstream content;
  content << inputStream.rdbuf();
  return std::move(content).str();
}

int File::write(std::string_view data) const {
  log::debug("Writing {} bytes to {}", data.size(), _filePath);

  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path(_filePath).parent_path(), ec);
  if (ec) {
    log::warn("Unable to create parent directory of {}: {}", _filePath, ec.message());
  }

  std::ofstream outputStream(_filePath, std::ios_base::out | std::ios_base::trunc);
  if (!outputStream) {
    if (_ifError == IfError::kThrow) {
      throw exception("Unable to open {} for writing", _filePath);
    }
    log::error("Unable to open {} for writing", _filePath);
    return 0;
  }
  outputStream << data << '\n';
  return static_cast<int>(data.size()) + 1;
}

}  // namespace mdist
