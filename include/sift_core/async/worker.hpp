#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace sift_core {
class ServiceProvider;
}

namespace sift_core {
namespace async {

/**
 * @class Worker
 * @brief A single background thread that claims and runs ingestion jobs.
 *
 * The worker polls the job queue, runs each claimed job to completion and records its outcome.
 * Claiming skips documents that already have a job in progress, so ingestion is serialized per
 * document while distinct documents run on different workers.
 *
 * Non-copyable and non-movable so the underlying thread has a single owner.
 */
class Worker {
 public:
  /**
   * @param worker_id Identifier used in log lines.
   * @param services Shared services used to run tasks.
   * @param poll_interval Sleep between polls of an empty queue.
   */
  Worker(int worker_id,
         std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

  /**
   * @brief Stops the loop and joins the thread; an in-flight job finishes first.
   */
  ~Worker();

  // Throws if the worker is already running.
  void start();

  // Non-blocking; the loop exits after its current job.
  void stop();

  // Claims and runs at most one job on the calling thread. Returns false if none was pending.
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop{false};
  std::thread thread;
};
}  // namespace async
}  // namespace sift_core
