#include "logginginfo.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string_view>

#include "log-config.hpp"
#include "mdist_exception.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_log.hpp"

namespace mdist {

namespace {
constexpr std::string_view kDataDir = "memodist_logginginfo_test_data";
}  // namespace

TEST(LoggingInfo, DefaultConfig) {
  LoggingInfo loggingInfo(kDataDir, schema::LogConfig{});

  EXPECT_EQ(loggingInfo.consoleLevel(), log::level::info);
  EXPECT_EQ(loggingInfo.fileLevel(), log::level::off);
  EXPECT_NE(log::get(LoggingInfo::kOutputLoggerName), nullptr);

  log::info("default config");
}

TEST(LoggingInfo, LevelsByNameAndPosition) {
  schema::LogConfig logConfig;
  logConfig.consoleLevel = "debug";
  logConfig.fileLevel = "0";

  LoggingInfo loggingInfo(kDataDir, logConfig);

  EXPECT_EQ(loggingInfo.consoleLevel(), log::level::debug);
  EXPECT_EQ(loggingInfo.fileLevel(), log::level::off);
}

TEST(LoggingInfo, LogFileIsInLogDirectory) {
  std::filesystem::remove_all(kDataDir);

  schema::LogConfig logConfig;
  logConfig.consoleLevel = "off";
  logConfig.fileLevel = "info";

  {
    LoggingInfo loggingInfo(kDataDir, logConfig);
    EXPECT_EQ(loggingInfo.logFilePath(), "memodist_logginginfo_test_data/log/log.txt");

    log::info("written to log file");
  }

  EXPECT_TRUE(std::filesystem::exists("memodist_logginginfo_test_data/log/log.txt"));

  std::filesystem::remove_all(kDataDir);
}

TEST(LoggingInfo, OutputLoggerIsDroppedAtDestruction) {
  { LoggingInfo loggingInfo(kDataDir, schema::LogConfig{}); }

  EXPECT_EQ(log::get(LoggingInfo::kOutputLoggerName), nullptr);

  // loggers can be created again afterwards
  LoggingInfo loggingInfo(kDataDir, schema::LogConfig{});
  log::get(LoggingInfo::kOutputLoggerName)->info("output");
}

TEST(LoggingInfo, InvalidLevel) {
  schema::LogConfig logConfig;
  logConfig.consoleLevel = "verbose";

  EXPECT_THROW(LoggingInfo(kDataDir, logConfig), exception);
}

TEST(LoggingInfo, InvalidRotation) {
  schema::LogConfig logConfig;
  logConfig.maxFileSize.sizeInBytes = 0;

  EXPECT_THROW(LoggingInfo(kDataDir, logConfig), invalid_argument);

  logConfig.maxFileSize.sizeInBytes = 1024;
  logConfig.maxNbFiles = -1;

  EXPECT_THROW(LoggingInfo(kDataDir, logConfig), invalid_argument);
}

}  // namespace mdist
