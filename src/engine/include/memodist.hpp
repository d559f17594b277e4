#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "levenshteindistancecalculator.hpp"
#include "mdist_string.hpp"
#include "mdist_vector.hpp"
#include "memoizingcache.hpp"
#include "threadpool.hpp"
#include "timedef.hpp"

namespace mdist {

class Memodist;

/// Fibonacci function whose recursive calls go through the memoizing cache of its Memodist.
class MemoizedFibonacci {
 public:
  explicit MemoizedFibonacci(Memodist &memodist) : _pMemodist(&memodist) {}

  uint64_t operator()(int n) const;

 private:
  Memodist *_pMemodist;
};

/// Entry point of the memodist computations: edit distance, memoized Fibonacci numbers evaluated in a thread pool
/// and asynchronous pipeline with fallback.
class Memodist {
 public:
  // Fibonacci(94) does not fit in an uint64_t
  static constexpr int kMaxFibonacciIndex = 93;

  /// Throws invalid_argument if number of threads or batch timeout are not strictly positive.
  Memodist(int nbThreads, Duration batchTimeout);

  int distance(std::string_view word1, std::string_view word2) {
    return _levenshteinDistanceCalculator(word1, word2);
  }

  /// Memoized Fibonacci number of index n.
  /// Throws invalid_argument if n is not in [0, kMaxFibonacciIndex].
  uint64_t fibonacci(int n);

  /// Computes in parallel the Fibonacci numbers of given indexes.
  /// Only the values computed within the batch timeout are returned, in the order of the indexes.
  vector<uint64_t> fibonacciBatch(std::span<const int> indexes);

  /// Maps given payload to its uppercase version in the thread pool, or to a fallback value if payload is empty.
  string pipeline(std::string_view payload);

  auto nbMemoizedFibonacci() const { return _fibonacciCache.size(); }

  Duration batchTimeout() const { return _batchTimeout; }

  auto nbWorkers() const { return _threadPool.nbWorkers(); }

 private:
  LevenshteinDistanceCalculator _levenshteinDistanceCalculator;
  MemoizingCache<MemoizedFibonacci, int> _fibonacciCache;
  Duration _batchTimeout;
  // Declared last so that tasks still running at destruction finish before the cache is destroyed
  ThreadPool _threadPool;
};

}  // namespace mdist
