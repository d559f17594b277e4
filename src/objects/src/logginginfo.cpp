#include "logginginfo.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>

#include "file.hpp"
#include "log-config.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_log.hpp"
#include "mdist_vector.hpp"
#include "parseloglevel.hpp"

namespace mdist {

namespace {

constexpr std::string_view kLogFileName = "log.txt";

log::sink_ptr CreateConsoleSink(log::level::level_enum level) {
  auto sink = std::make_shared<log::sinks::stderr_color_sink_mt>();
  sink->set_level(level);
  return sink;
}

log::sink_ptr CreateRotatingFileSink(std::string_view filePath, int64_t maxFileSizeInBytes, int32_t maxNbFiles,
                                     log::level::level_enum level) {
  auto sink = std::make_shared<log::sinks::rotating_file_sink_mt>(
      log::filename_t(filePath), static_cast<std::size_t>(maxFileSizeInBytes), static_cast<std::size_t>(maxNbFiles));
  sink->set_level(level);
  return sink;
}

// Results of commands are printed as is on standard output, sharing the thread of the default logger
void RegisterOutputLogger() {
  auto outputLogger = std::make_shared<log::async_logger>(
      LoggingInfo::kOutputLoggerName, std::make_shared<log::sinks::stdout_color_sink_mt>(), log::thread_pool(),
      log::async_overflow_policy::block);
  outputLogger->set_level(log::level::info);
  outputLogger->set_pattern("%v");

  log::register_logger(std::move(outputLogger));
}

}  // namespace

LoggingInfo::LoggingInfo(std::string_view dataDir, const schema::LogConfig &logConfig)
    : _logFile(dataDir, File::Type::kLog, kLogFileName, File::IfError::kThrow),
      _maxFileSizeInBytes(logConfig.maxFileSize.sizeInBytes),
      _maxNbFiles(logConfig.maxNbFiles),
      _consoleLevel(LevelFromPos(LogPosFromLogStr(logConfig.consoleLevel))),
      _fileLevel(LevelFromPos(LogPosFromLogStr(logConfig.fileLevel))) {
  if (_maxFileSizeInBytes <= 0 || _maxNbFiles <= 0) {
    throw invalid_argument("Invalid log file rotation parameters: max size {}, max files {}", _maxFileSizeInBytes,
                           _maxNbFiles);
  }

  vector<log::sink_ptr> sinks;
  if (_consoleLevel != log::level::off) {
    sinks.push_back(CreateConsoleSink(_consoleLevel));
  }
  if (_fileLevel != log::level::off) {
    sinks.push_back(CreateRotatingFileSink(_logFile.path(), _maxFileSizeInBytes, _maxNbFiles, _fileLevel));
  }

  // a single logger thread keeps the order between the output logger and the default one
  static constexpr std::size_t kQueueSize = 8192;
  static constexpr std::size_t kNbLoggerThreads = 1;
  log::init_thread_pool(kQueueSize, kNbLoggerThreads);

  if (sinks.empty()) {
    log::set_level(log::level::off);
  } else {
    auto logger = std::make_shared<log::async_logger>("", sinks.begin(), sinks.end(), log::thread_pool(),
                                                      log::async_overflow_policy::block);
    // lower level_enum is more verbose, and the logger filters before its sinks
    logger->set_level(std::min(_consoleLevel, _fileLevel));
    log::set_default_logger(std::move(logger));
  }

  RegisterOutputLogger();
}

LoggingInfo::~LoggingInfo() {
  log::drop(kOutputLoggerName);
}

}  // namespace mdist
