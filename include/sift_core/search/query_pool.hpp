#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace sift_core {

// Set on the future of a job that was still queued when its deadline passed.
class QueryExpiredError : public std::runtime_error {
 public:
  QueryExpiredError() : std::runtime_error("Query work expired before it started") {}
};

/**
 * @class QueryPool
 * @brief Fixed set of threads running the blocking steps of searches.
 *
 * A search that gives up at its deadline leaves its jobs behind; they finish on a pool thread, or
 * are dropped unrun if they are still queued past the deadline. However many searches time out,
 * query work never holds more than size() threads, embedder permits or pooled connections.
 */
class QueryPool {
 public:
  using Clock = std::chrono::steady_clock;

  // Zero threads is rejected with std::invalid_argument.
  explicit QueryPool(size_t num_threads);

  // Drops queued jobs and joins the threads once their current jobs finish.
  ~QueryPool();

  template <typename Fn>
  auto submit(Fn fn, Clock::time_point deadline) -> std::future<decltype(fn())> {
    using Result = decltype(fn());
    // shared_ptr keeps the move-only task inside a copyable std::function
    auto task = std::make_shared<std::packaged_task<Result()>>(
        [fn = std::move(fn), deadline]() mutable -> Result {
          if (Clock::now() >= deadline) {
            throw QueryExpiredError();
          }
          return fn();
        });
    auto future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
  }

  size_t size() const {
    return m_threads.size();
  }
  size_t queued() const;

  QueryPool(const QueryPool&) = delete;
  QueryPool& operator=(const QueryPool&) = delete;
  QueryPool(QueryPool&&) = delete;
  QueryPool& operator=(QueryPool&&) = delete;

 private:
  void enqueue(std::function<void()> job);
  void run();

  std::vector<std::thread> m_threads;
  std::queue<std::function<void()>> m_jobs;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  bool m_stopping = false;
};

}  // namespace sift_core
