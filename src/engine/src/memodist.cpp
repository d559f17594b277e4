#include "memodist.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <span>
#include <string_view>

#include "asyncpipeline.hpp"
#include "durationstring.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_log.hpp"
#include "mdist_string.hpp"
#include "mdist_vector.hpp"
#include "timedef.hpp"
#include "toupperlower-string.hpp"

namespace mdist {

uint64_t MemoizedFibonacci::operator()(int n) const {
  if (n < 2) {
    return static_cast<uint64_t>(n);
  }
  return _pMemodist->fibonacci(n - 1) + _pMemodist->fibonacci(n - 2);
}

Memodist::Memodist(int nbThreads, Duration batchTimeout)
    : _fibonacciCache(*this), _batchTimeout(batchTimeout), _threadPool(nbThreads, "memodist") {
  if (_batchTimeout <= Duration::zero()) {
    throw invalid_argument("Batch timeout should be strictly positive");
  }
  log::debug("Memodist created with {} thread(s) and a batch timeout of {}", nbThreads,
             DurationToString(_batchTimeout));
}

uint64_t Memodist::fibonacci(int n) {
  if (n < 0 || n > kMaxFibonacciIndex) {
    throw invalid_argument("Fibonacci index {} is out of range [0, {}]", n, kMaxFibonacciIndex);
  }
  return _fibonacciCache.get(n);
}

vector<uint64_t> Memodist::fibonacciBatch(std::span<const int> indexes) {
  vector<std::function<uint64_t()>> tasks;
  tasks.reserve(indexes.size());
  for (int n : indexes) {
    if (n < 0 || n > kMaxFibonacciIndex) {
      throw invalid_argument("Fibonacci index {} is out of range [0, {}]", n, kMaxFibonacciIndex);
    }
    tasks.emplace_back([this, n] { return fibonacci(n); });
  }

  const TimePoint startTime = Clock::now();

  auto results = _threadPool.invokeAllFor(tasks, _batchTimeout);

  log::info("{} Fibonacci number(s) computed out of {} in {} ms, {} memoized value(s)", results.size(),
            indexes.size(), GetTimeFrom<milliseconds>(startTime).count(), _fibonacciCache.size());

  return results;
}

string Memodist::pipeline(std::string_view payload) {
  auto future = SupplyAsyncWithFallback(
      _threadPool,
      [payload = string(payload)] {
        if (payload.empty()) {
          throw invalid_argument("Empty payload");
        }
        return payload;
      },
      [](const string &str) {
        string ret("mapped:");
        ret.append(ToUpper(str));
        return ret;
      },
      [](const std::exception &e) {
        string ret("fallback:");
        ret.append(e.what());
        return ret;
      });

  return future.get();
}

}  // namespace mdist
