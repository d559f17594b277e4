#include "stringconv.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "mdist_exception.hpp"
#include "mdist_string.hpp"

namespace mdist {
TEST(AppendIntegralToString, Zero) {
  string str;
  AppendIntegralToString(str, 0);
  EXPECT_EQ(str, "0");
}

TEST(AppendIntegralToString, AppendsAfterExistingContent) {
  string str("Fibonacci(10) = ");
  AppendIntegralToString(str, 55);
  EXPECT_EQ(str, "Fibonacci(10) = 55");
  AppendIntegralToString(str, -1);
  EXPECT_EQ(str, "Fibonacci(10) = 55-1");
}

TEST(AppendIntegralToString, Limits) {
  string str;
  AppendIntegralToString(str, std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(str, "18446744073709551615");

  str.clear();
  AppendIntegralToString(str, std::numeric_limits<int64_t>::min());
  EXPECT_EQ(str, "-9223372036854775808");
}

TEST(StringToIntegral, FibonacciIndexes) {
  EXPECT_EQ(StringToIntegral("0"), 0);
  EXPECT_EQ(StringToIntegral("93"), 93);
  EXPECT_EQ(StringToIntegral("-2"), -2);
  EXPECT_EQ(StringToIntegral<int64_t>("9223372036854775807"), std::numeric_limits<int64_t>::max());
}

TEST(StringToIntegral, Invalid) {
  EXPECT_THROW(StringToIntegral(""), exception);
  EXPECT_THROW(StringToIntegral("ten"), exception);
  EXPECT_THROW(StringToIntegral("12a"), exception);
  EXPECT_THROW(StringToIntegral(" 12"), exception);
  EXPECT_THROW(StringToIntegral<int8_t>("300"), exception);
}
}  // namespace mdist
