#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <ranges>
#include <string_view>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>

#include "mdist_exception.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_log.hpp"
#include "mdist_string.hpp"
#include "mdist_vector.hpp"
#include "timedef.hpp"

namespace mdist {

/// @brief Fixed size pool of named worker threads consuming a FIFO queue of tasks.
/// Workers are joined at destruction, after the remaining queued tasks have been run.
class ThreadPool {
 public:
  /// Throws invalid_argument if 'nbThreads' is not strictly positive.
  explicit ThreadPool(int nbThreads = 1, std::string_view name = "worker");

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  ~ThreadPool();

  auto nbWorkers() const noexcept { return _workers.size(); }

  std::string_view name() const noexcept { return _name; }

  /// Schedules 'func(args...)' and returns the future of its result.
  /// Arguments are stored by value, wrap them with std::ref to pass them by reference.
  template <class Func, class... Args>
  std::future<std::invoke_result_t<std::decay_t<Func>&, std::decay_t<Args>&...>> enqueue(Func&& func, Args&&... args);

  /// Runs a copy of each nullary task of 'tasks' and waits at most 'timeout' for all of them.
  /// Returns the results of the tasks which completed before the deadline, in tasks order.
  /// A task which has not started at the deadline is skipped, and the result of a task which finishes after the
  /// deadline is discarded. A task throwing a std::exception is logged and excluded from the results.
  /// The copies of the tasks still running after the return of this function should only reference objects
  /// outliving the thread pool.
  template <std::ranges::input_range Tasks>
    requires std::invocable<std::ranges::range_reference_t<Tasks>>
  auto invokeAllFor(Tasks&& tasks, Duration timeout);

 private:
  void run();

  std::queue<std::function<void()>> _tasks;
  std::mutex _queueMutex;
  std::condition_variable _condition;
  bool _stop = false;

  string _name;

  // last member: the jthreads are joined first at destruction, while the queue is still alive
  vector<std::jthread> _workers;
};

template <class Func, class... Args>
std::future<std::invoke_result_t<std::decay_t<Func>&, std::decay_t<Args>&...>> ThreadPool::enqueue(Func&& func,
                                                                                                    Args&&... args) {
  using ResultType = std::invoke_result_t<std::decay_t<Func>&, std::decay_t<Args>&...>;

  // std::function requires a copyable callable, hence the shared packaged_task
  auto pTask = std::make_shared<std::packaged_task<ResultType()>>(
      [func = std::forward<Func>(func),
       argsTuple = std::tuple<std::decay_t<Args>...>(std::forward<Args>(args)...)]() mutable {
        return std::apply(func, argsTuple);
      });

  auto future = pTask->get_future();
  {
    std::lock_guard<std::mutex> lock(_queueMutex);
    if (_stop) {
      throw exception("{} thread pool is stopping, no more tasks can be enqueued", _name);
    }
    _tasks.emplace([pTask] { (*pTask)(); });
  }
  _condition.notify_one();
  return future;
}

template <std::ranges::input_range Tasks>
  requires std::invocable<std::ranges::range_reference_t<Tasks>>
auto ThreadPool::invokeAllFor(Tasks&& tasks, Duration timeout) {
  using TaskType = std::remove_cvref_t<std::ranges::range_reference_t<Tasks>>;
  using ResultType = std::remove_cvref_t<std::invoke_result_t<TaskType&>>;

  if (timeout <= Duration::zero()) {
    throw invalid_argument("timeout of a batch invocation should be strictly positive");
  }

  const TimePoint deadline = Clock::now() + timeout;

  // Shared with the enqueued tasks which may outlive this call
  auto pExpired = std::make_shared<std::atomic<bool>>(false);

  vector<std::future<std::optional<ResultType>>> futures;
  if constexpr (std::ranges::sized_range<Tasks>) {
    futures.reserve(std::ranges::size(tasks));
  }
  for (auto&& task : tasks) {
    futures.push_back(enqueue([pExpired, deadline, task = TaskType(task)]() mutable -> std::optional<ResultType> {
      if (pExpired->load(std::memory_order_acquire) || Clock::now() > deadline) {
        return std::nullopt;
      }
      std::optional<ResultType> result(std::invoke(task));
      if (Clock::now() > deadline) {
        // too late, even if the caller has not checked this task yet
        result.reset();
      }
      return result;
    }));
  }

  vector<ResultType> results;
  results.reserve(futures.size());
  int nbLate = 0;
  int nbFailed = 0;
  for (auto& future : futures) {
    if (future.wait_until(deadline) != std::future_status::ready) {
      pExpired->store(true, std::memory_order_release);
      ++nbLate;
      continue;
    }
    try {
      if (auto optResult = future.get()) {
        results.push_back(std::move(*optResult));
      } else {
        ++nbLate;
      }
    } catch (const std::exception& e) {
      log::error("task of {} thread pool failed: {}", _name, e.what());
      ++nbFailed;
    }
  }

  if (nbLate != 0) {
    log::warn("{}/{} task(s) of {} thread pool did not complete within {} ms", nbLate, futures.size(), _name,
              std::chrono::duration_cast<milliseconds>(timeout).count());
  }
  if (nbFailed != 0) {
    log::error("{}/{} task(s) of {} thread pool failed", nbFailed, futures.size(), _name);
  }
  return results;
}

}  // namespace mdist
