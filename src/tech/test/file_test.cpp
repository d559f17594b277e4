#include "file.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string_view>

#include "mdist_exception.hpp"
#include "mdist_string.hpp"

namespace mdist {

class FileTest : public ::testing::Test {
 protected:
  void TearDown() override { std::filesystem::remove_all(kDataDir); }

  static constexpr std::string_view kDataDir = "memodist_file_test_data";
};

TEST_F(FileTest, Path) {
  EXPECT_EQ(File(kDataDir, File::Type::kStatic, "config.json", File::IfError::kThrow).path(),
            "memodist_file_test_data/static/config.json");
  EXPECT_EQ(File(kDataDir, File::Type::kLog, "log.txt", File::IfError::kThrow).path(),
            "memodist_file_test_data/log/log.txt");
}

TEST_F(FileTest, ReadNonExistingFile) {
  File noThrowFile(kDataDir, File::Type::kStatic, "unknown.json", File::IfError::kNoThrow);
  EXPECT_FALSE(noThrowFile.exists());
  EXPECT_EQ(noThrowFile.readAll(), "");

  File throwFile(kDataDir, File::Type::kStatic, "unknown.json", File::IfError::kThrow);
  EXPECT_THROW(throwFile.readAll(), exception);
}

TEST_F(FileTest, WriteThenRead) {
  File file(kDataDir, File::Type::kStatic, "data.txt", File::IfError::kThrow);
  EXPECT_EQ(file.write("memoized"), 9);
  EXPECT_TRUE(file.exists());
  EXPECT_EQ(file.readAll(), "memoized\n");

  EXPECT_EQ(file.write("v2"), 3);
  EXPECT_EQ(file.readAll(), "v2\n");
}

}  // namespace mdist
