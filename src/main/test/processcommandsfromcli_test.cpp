#include "processcommandsfromcli.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string_view>

#include "mdist_exception.hpp"
#include "memodistoptions.hpp"

namespace mdist {

class ProcessCommandsFromCLITest : public ::testing::Test {
 protected:
  ProcessCommandsFromCLITest() { cmdLineOptions.dataDir = kDataDir; }

  void TearDown() override { std::filesystem::remove_all(kDataDir); }

  static constexpr std::string_view kDataDir = "memodist_cli_test_data";

  MemodistCmdLineOptions cmdLineOptions;
};

TEST_F(ProcessCommandsFromCLITest, NoCommand) {
  EXPECT_EQ(ProcessCommandsFromCLI(cmdLineOptions), EXIT_SUCCESS);

  // general config file is created with default values
  EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(kDataDir) / "static" / "generalconfig.json"));
}

TEST_F(ProcessCommandsFromCLITest, AllCommands) {
  cmdLineOptions.distance = "kitten,sitting";
  cmdLineOptions.fibonacci = "5,10,15";
  cmdLineOptions.pipeline = "payload";
  cmdLineOptions.nbThreads = 2;
  cmdLineOptions.batchTimeout = std::chrono::seconds(3);

  EXPECT_EQ(ProcessCommandsFromCLI(cmdLineOptions), EXIT_SUCCESS);
}

TEST_F(ProcessCommandsFromCLITest, CommandFailure) {
  cmdLineOptions.fibonacci = "100";

  EXPECT_EQ(ProcessCommandsFromCLI(cmdLineOptions), EXIT_FAILURE);
}

TEST_F(ProcessCommandsFromCLITest, InvalidNumberOfThreads) {
  cmdLineOptions.distance = "a,b";
  cmdLineOptions.nbThreads = -2;

  EXPECT_EQ(ProcessCommandsFromCLI(cmdLineOptions), EXIT_FAILURE);
}

TEST_F(ProcessCommandsFromCLITest, InvalidLogLevel) {
  cmdLineOptions.logConsole = "chatty";

  EXPECT_THROW(ProcessCommandsFromCLI(cmdLineOptions), exception);
}

}  // namespace mdist
