#include "asyncpipeline.hpp"

#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <string_view>

#include "mdist_string.hpp"
#include "threadpool.hpp"

namespace mdist {

namespace {
auto MapLength() {
  return [](const string &str) { return static_cast<int>(str.size()); };
}

auto FallbackMinusOne() {
  return [](const std::exception &) { return -1; };
}
}  // namespace

class AsyncPipelineTest : public ::testing::Test {
 protected:
  ThreadPool threadPool{2, "pipeline"};
};

TEST_F(AsyncPipelineTest, Nominal) {
  auto future = SupplyAsyncWithFallback(
      threadPool, [] { return string("payload"); }, MapLength(), FallbackMinusOne());
  EXPECT_EQ(future.get(), 7);
}

TEST_F(AsyncPipelineTest, SupplierFailure) {
  auto future = SupplyAsyncWithFallback(
      threadPool, []() -> string { throw std::runtime_error("random failure"); }, MapLength(), FallbackMinusOne());
  EXPECT_EQ(future.get(), -1);
}

TEST_F(AsyncPipelineTest, MapperFailure) {
  auto future = SupplyAsyncWithFallback(
      threadPool, [] { return 3; },
      [](int val) -> string {
        if (val == 3) {
          throw std::invalid_argument("3 is not accepted");
        }
        return "ok";
      },
      [](const std::exception &e) { return string("fallback:").append(e.what()); });
  EXPECT_EQ(future.get(), "fallback:3 is not accepted");
}

TEST_F(AsyncPipelineTest, FallbackFailureIsStoredInFuture) {
  auto future = SupplyAsyncWithFallback(
      threadPool, []() -> int { throw std::runtime_error("first failure"); }, [](int val) { return val; },
      [](const std::exception &) -> int { throw std::logic_error("second failure"); });
  EXPECT_THROW(future.get(), std::logic_error);
}

}  // namespace mdist
