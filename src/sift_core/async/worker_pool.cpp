#include "sift_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace sift_core::async {

WorkerPool::WorkerPool(size_t num_threads,
                       std::shared_ptr<ServiceProvider> services,
                       std::chrono::milliseconds poll_interval) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  m_workers.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back(
        std::make_unique<Worker>(static_cast<int>(i), services, poll_interval));
  }
  std::cout << "WorkerPool created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  std::cout << "WorkerPool destructor called. Shutting down all workers..." << std::endl;
  if (m_is_running) {
    stop();
  }
}

void WorkerPool::start() {
  if (m_is_running) {
    std::cerr << "Warning: WorkerPool is already running." << std::endl;
    return;
  }
  std::cout << "Starting all workers in the pool..." << std::endl;
  for (const auto& worker : m_workers) {
    worker->start();
  }
  m_is_running = true;
}

void WorkerPool::stop() {
  if (!m_is_running) {
    return;
  }
  std::cout << "Stopping all workers in the pool..." << std::endl;
  for (const auto& worker : m_workers) {
    worker->stop();
  }
  m_is_running = false;
}

}  // namespace sift_core::async
