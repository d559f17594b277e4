#pragma once

#include <cstdint>
#include <string_view>

#include "file.hpp"
#include "log-config.hpp"
#include "mdist_log.hpp"

namespace mdist {

/// Owns the loggers of the program for its lifetime: the default logger, writing to standard error and to rotating
/// log files in the data directory, and the output logger, writing command results to standard output.
/// Loggers are created at construction and the output logger is dropped at destruction.
class LoggingInfo {
 public:
  static constexpr char const *const kOutputLoggerName = "output";

  /// Throws exception if one of the levels is not recognized, invalid_argument for invalid rotation parameters.
  LoggingInfo(std::string_view dataDir, const schema::LogConfig &logConfig);

  LoggingInfo(const LoggingInfo &) = delete;
  LoggingInfo &operator=(const LoggingInfo &) = delete;

  ~LoggingInfo();

  log::level::level_enum consoleLevel() const { return _consoleLevel; }
  log::level::level_enum fileLevel() const { return _fileLevel; }

  std::string_view logFilePath() const { return _logFile.path(); }

 private:
  File _logFile;
  int64_t _maxFileSizeInBytes;
  int32_t _maxNbFiles;
  log::level::level_enum _consoleLevel;
  log::level::level_enum _fileLevel;
};

}  // namespace mdist
