#pragma once

#include <chrono>
#include <cstdint>

#include "duration-schema.hpp"

namespace mdist::schema {

struct ConcurrencyConfig {
  // Number of threads of the thread pool evaluating batches of memoized computations
  int32_t nbThreads{4};
  // Overall time budget of a batch of computations
  Duration batchTimeout{std::chrono::seconds(5)};
};

}  // namespace mdist::schema
