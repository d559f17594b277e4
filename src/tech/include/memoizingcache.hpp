#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "mdist_exception.hpp"
#include "mdist_hash.hpp"

namespace mdist {

/// Wrapper of a pure functor F whose results are computed at most once per key and then kept forever.
/// The key is built from the arguments given to get(), which should match FuncTArgs.
///
/// Thread safety: get() can be called concurrently from several threads, for same or different keys.
/// Only one thread computes the result of a given key; other callers for this key wait for it and receive the same
/// committed value. F is called without holding the cache lock, so it can itself call get() on other keys.
/// If F throws, the exception is propagated to the computing thread and to all threads waiting for this key,
/// and nothing is committed: next get() for this key will call F again.
///
/// Returned pointers / references from get() / retrieve() are valid as long as the MemoizingCache object lives, as
/// committed values are never evicted.
template <class F, class... FuncTArgs>
class MemoizingCache {
 public:
  using ResultType = std::remove_cvref_t<std::invoke_result_t<F &, const std::remove_cvref_t<FuncTArgs> &...>>;

 private:
  using TKey = std::tuple<std::remove_cvref_t<FuncTArgs>...>;
  using SharedFuture = std::shared_future<ResultType>;

  struct Entry {
    SharedFuture _future;
    // id of the thread computing the value, default constructed once committed
    std::thread::id _computingThreadId;
  };

 public:
  template <class... TArgs>
  explicit MemoizingCache(TArgs &&...args) : _func(std::forward<TArgs>(args)...) {}

  MemoizingCache(const MemoizingCache &) = delete;
  MemoizingCache(MemoizingCache &&) = delete;
  MemoizingCache &operator=(const MemoizingCache &) = delete;
  MemoizingCache &operator=(MemoizingCache &&) = delete;

  ~MemoizingCache() = default;

  /// Get the value associated to the key built with given parameters, computing it if needed.
  template <class... Args>
  const ResultType &get(Args &&...funcArgs) {
    TKey key(std::forward<Args>(funcArgs)...);

    std::unique_lock<std::mutex> lock(_mutex);

    auto [it, isInserted] = _data.try_emplace(key);
    Entry &entry = it->second;
    if (!isInserted) {
      if (entry._computingThreadId == std::this_thread::get_id()) {
        throw exception("Recursive computation of a memoized value for the same key");
      }
      // Copy the future so that we can wait on it without holding the lock.
      SharedFuture future = entry._future;
      lock.unlock();
      // The shared state is also owned by the committed entry, so the returned reference stays valid after the
      // destruction of the local copy.
      return future.get();
    }

    std::promise<ResultType> promise;
    entry._future = promise.get_future().share();
    entry._computingThreadId = std::this_thread::get_id();
    SharedFuture future = entry._future;

    lock.unlock();

    try {
      promise.set_value(std::apply(_func, std::as_const(key)));
    } catch (...) {
      // Release the key before waking up the waiting threads, so that the next get() will compute it again
      {
        std::lock_guard<std::mutex> guard(_mutex);
        _data.erase(key);
      }
      promise.set_exception(std::current_exception());
      throw;
    }

    {
      std::lock_guard<std::mutex> guard(_mutex);
      entry._computingThreadId = std::thread::id();
      ++_nbCommitted;
    }

    return future.get();
  }

  /// Retrieve a pointer to the committed value associated to the key built with given parameters.
  /// If no value has been committed for this key (never asked, or still being computed), returns a nullptr.
  template <class... Args>
  const ResultType *retrieve(Args &&...funcArgs) const {
    std::lock_guard<std::mutex> guard(_mutex);
    auto it = _data.find(TKey(std::forward<Args>(funcArgs)...));
    if (it == _data.end() || it->second._computingThreadId != std::thread::id()) {
      return nullptr;
    }
    return std::addressof(it->second._future.get());
  }

  template <class... Args>
  bool contains(Args &&...funcArgs) const {
    return retrieve(std::forward<Args>(funcArgs)...) != nullptr;
  }

  /// Number of committed values.
  auto size() const {
    std::lock_guard<std::mutex> guard(_mutex);
    return _nbCommitted;
  }

 private:
  F _func;
  mutable std::mutex _mutex;
  // References to values of std::unordered_map are not invalidated by insertions
  std::unordered_map<TKey, Entry, HashTuple> _data;
  std::size_t _nbCommitted{};
};

}  // namespace mdist
