#pragma once

#include <exception>
#include <functional>
#include <future>
#include <type_traits>
#include <utility>

#include "mdist_log.hpp"
#include "threadpool.hpp"

namespace mdist {

/// Computes asynchronously 'mapper(supplier())' in given thread pool.
/// If the supplier or the mapper throws a std::exception, the returned future holds instead the result of
/// 'fallback(exception)'. An exception thrown by the fallback itself is stored in the future.
template <class Supplier, class Mapper, class Fallback>
  requires std::invocable<Supplier&> && std::invocable<Mapper&, std::invoke_result_t<Supplier&>>
auto SupplyAsyncWithFallback(ThreadPool& threadPool, Supplier supplier, Mapper mapper, Fallback fallback) {
  using ResultType = std::remove_cvref_t<std::invoke_result_t<Mapper&, std::invoke_result_t<Supplier&>>>;

  static_assert(std::is_convertible_v<std::invoke_result_t<Fallback&, const std::exception&>, ResultType>,
                "fallback should return a type convertible to the mapper result type");

  return threadPool.enqueue(
      [supplier = std::move(supplier), mapper = std::move(mapper), fallback = std::move(fallback)]() mutable {
        try {
          return ResultType(std::invoke(mapper, std::invoke(supplier)));
        } catch (const std::exception& e) {
          log::debug("async pipeline failed with '{}', using fallback", e.what());
          return ResultType(std::invoke(fallback, e));
        }
      });
}

}  // namespace mdist
