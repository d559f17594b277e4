#include "threadpool.hpp"

#include <mutex>
#include <string_view>
#include <utility>

#include "mdist_invalid_argument_exception.hpp"
#include "mdist_log.hpp"

namespace mdist {

ThreadPool::ThreadPool(int nbThreads, std::string_view name) : _name(name) {
  if (nbThreads <= 0) {
    throw invalid_argument("{} thread pool needs a strictly positive number of threads, not {}", _name, nbThreads);
  }
  _workers.reserve(static_cast<decltype(_workers)::size_type>(nbThreads));
  while (static_cast<int>(_workers.size()) < nbThreads) {
    _workers.emplace_back([this] { run(); });
  }
  log::debug("{} thread pool started with {} thread(s)", _name, nbThreads);
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(_queueMutex);
    _stop = true;
  }
  _condition.notify_all();
}

void ThreadPool::run() {
  std::unique_lock<std::mutex> lock(_queueMutex);
  while (true) {
    _condition.wait(lock, [this] { return _stop || !_tasks.empty(); });
    if (_tasks.empty()) {
      // stop requested and nothing left to run
      return;
    }
    auto task = std::move(_tasks.front());
    _tasks.pop();

    lock.unlock();
    task();
    lock.lock();
  }
}

}  // namespace mdist
