#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "sift_core/async/worker.hpp"

namespace sift_core::async {

/**
 * @class WorkerPool
 * @brief Owns the ingestion worker threads: creates them, starts them and shuts them down.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads Number of workers; zero is rejected with std::invalid_argument.
   * @param services Services shared by every worker.
   */
  WorkerPool(size_t num_threads,
             std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

  // Stops and joins all workers.
  ~WorkerPool();

  void start();

  // Signals every worker; does not block. Joining happens on destruction.
  void stop();

  size_t size() const {
    return m_workers.size();
  }
  bool is_running() const {
    return m_is_running;
  }

  // --- Rule of Five: Make the class non-copyable and non-movable ---
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace sift_core::async
