#include "sift_core/search/query_pool.hpp"

namespace sift_core {

QueryPool::QueryPool(size_t num_threads) {
  if (num_threads == 0) {
    throw std::invalid_argument("QueryPool must have at least one thread.");
  }
  m_threads.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    m_threads.emplace_back([this]() { run(); });
  }
}

QueryPool::~QueryPool() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = true;
    // Destroying a queued packaged_task leaves a broken_promise on its future
    while (!m_jobs.empty()) {
      m_jobs.pop();
    }
  }
  m_cv.notify_all();
  for (auto& thread : m_threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

size_t QueryPool::queued() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_jobs.size();
}

void QueryPool::enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs.push(std::move(job));
  }
  m_cv.notify_one();
}

void QueryPool::run() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_cv.wait(lock, [this]() { return m_stopping || !m_jobs.empty(); });
      if (m_stopping) {
        return;
      }
      job = std::move(m_jobs.front());
      m_jobs.pop();
    }
    // packaged_task stores any exception in its future
    job();
  }
}

}  // namespace sift_core
