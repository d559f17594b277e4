#include "unitsparser.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "mdist_invalid_argument_exception.hpp"
#include "mdist_string.hpp"
#include "overflow-check.hpp"

namespace mdist {

namespace {
constexpr AmountUnit kDistanceUnits[] = {{"km", 1000}, {"m", 1}};
}  // namespace

TEST(ParseAmountWithUnits, Nominal) {
  EXPECT_EQ(ParseAmountWithUnits("3km 250m", kDistanceUnits, "distance"), 3250);
  EXPECT_EQ(ParseAmountWithUnits("0m", kDistanceUnits, "distance"), 0);
}

TEST(ParseAmountWithUnits, SymbolIsMandatoryWithoutEmptyUnit) {
  EXPECT_THROW(ParseAmountWithUnits("12", kDistanceUnits, "distance"), invalid_argument);
}

TEST(ParseAmountWithUnits, ErrorMessage) {
  try {
    ParseAmountWithUnits("4 miles", kDistanceUnits, "distance");
    FAIL() << "an invalid_argument was expected";
  } catch (const invalid_argument &e) {
    EXPECT_STREQ(e.what(), "Unknown unit 'miles' in distance '4 miles'");
  }
}

TEST(ParseAmountWithUnits, Limits) {
  EXPECT_EQ(ParseAmountWithUnits("9223372036854775807m", kDistanceUnits, "distance"),
            std::numeric_limits<int64_t>::max());
  EXPECT_THROW(ParseAmountWithUnits("9223372036854775808m", kDistanceUnits, "distance"), invalid_argument);
  EXPECT_THROW(ParseAmountWithUnits("9223372036854776km", kDistanceUnits, "distance"), invalid_argument);
  EXPECT_THROW(ParseAmountWithUnits("9223372036854775807m 1m", kDistanceUnits, "distance"), invalid_argument);
}

TEST(AppendAmountWithUnits, SignificantUnits) {
  string str("length: ");
  AppendAmountWithUnits(3250, kDistanceUnits, 1, str);
  EXPECT_EQ(str, "length: 3km");

  str.clear();
  AppendAmountWithUnits(-3250, kDistanceUnits, 2, str);
  EXPECT_EQ(str, "-3km250m");
}

TEST(AppendAmountWithUnits, MinimumValue) {
  string str;
  AppendAmountWithUnits(std::numeric_limits<int64_t>::min(), kDistanceUnits, 2, str);
  EXPECT_EQ(str, "-9223372036854775km808m");
}

TEST(ParseNumberOfBytes, Multipliers) {
  EXPECT_EQ(ParseNumberOfBytes("512"), 512);
  EXPECT_EQ(ParseNumberOfBytes("5Mi"), 5 * 1024 * 1024);
  EXPECT_EQ(ParseNumberOfBytes("2k"), 2000);
  EXPECT_EQ(ParseNumberOfBytes("2K"), 2000);
  EXPECT_EQ(ParseNumberOfBytes("2Ki"), 2048);
  EXPECT_EQ(ParseNumberOfBytes("1G"), 1000000000);
  EXPECT_EQ(ParseNumberOfBytes("1Gi512Mi"), 1536L * 1024 * 1024);
  EXPECT_EQ(ParseNumberOfBytes("3Ti"), 3L * 1024 * 1024 * 1024 * 1024);
}

TEST(ParseNumberOfBytes, Invalid) {
  EXPECT_THROW(ParseNumberOfBytes(""), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("2.5Mi"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("10Pi"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("9000000Ti"), invalid_argument);
}

TEST(BytesToStr, BinaryMultipliers) {
  EXPECT_EQ(BytesToStr(0), "0");
  EXPECT_EQ(BytesToStr(1000), "1000");
  EXPECT_EQ(BytesToStr(5L * 1024 * 1024), "5Mi");
  EXPECT_EQ(BytesToStr(1536L * 1024 * 1024 + 3), "1Gi512Mi3");
}

TEST(OverflowCheck, Sum) {
  static_assert(!WillSumOverflow(int64_t{1}, int64_t{2}));
  static_assert(WillSumOverflow(std::numeric_limits<int64_t>::max(), int64_t{1}));
  static_assert(WillSumOverflow(std::numeric_limits<int64_t>::min(), int64_t{-1}));
  static_assert(!WillSumOverflow(std::numeric_limits<int64_t>::min(), int64_t{1}));
}

TEST(OverflowCheck, NonNegativeProduct) {
  static_assert(!WillNonNegativeProductOverflow(int64_t{0}, std::numeric_limits<int64_t>::max()));
  static_assert(!WillNonNegativeProductOverflow(std::numeric_limits<int64_t>::max(), int64_t{0}));
  static_assert(WillNonNegativeProductOverflow(std::numeric_limits<int64_t>::max() / 2 + 1, int64_t{2}));
  static_assert(!WillNonNegativeProductOverflow(std::numeric_limits<int64_t>::max() / 2, int64_t{2}));
}

}  // namespace mdist
