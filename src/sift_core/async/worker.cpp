#include "sift_core/async/worker.hpp"

#include <iostream>

#include "sift_core/async/ITask.hpp"
#include "sift_core/async/service_provider.hpp"
#include "sift_core/async/task_factory.hpp"
#include "sift_core/db/job_repo.hpp"

namespace sift_core {
namespace async {

Worker::Worker(int worker_id,
               std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  // RAII: block until the thread has finished its current job
  if (thread.joinable()) {
    thread.join();
  }
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop.load()) {
    bool ran = false;
    try {
      ran = run_one_task();
    } catch (const std::exception& e) {
      // Claiming itself failed, e.g. the database was busy
      std::cerr << "Worker [" << worker_id_ << "] ERROR polling job queue: " << e.what()
                << std::endl;
    }
    if (!ran) {
      std::this_thread::sleep_for(poll_interval_);
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  JobRepo& job_repo = services_->get_job_repo();
  std::optional<Job> job = job_repo.fetch_and_claim_next_job();
  if (!job) {
    return false;
  }

  std::cout << "Worker [" << worker_id_ << "] claimed job " << job->id << " for '" << job->origin
            << "'" << std::endl;
  try {
    ITaskPtr task = TaskFactory::create_task(*job);
    ProgressUpdater on_progress = [&](float progress, const std::string& message) {
      job_repo.update_progress(job->id, progress);
      std::cout << "Worker [" << worker_id_ << "] job " << job->id << ": " << message << " ("
                << static_cast<int>(progress * 100) << "%)" << std::endl;
    };
    task->execute(*services_, on_progress);
    job_repo.mark_completed(job->id);
    std::cout << "Worker [" << worker_id_ << "] job " << job->id << " completed." << std::endl;
  } catch (const JobCancelledError& e) {
    std::cout << "Worker [" << worker_id_ << "] job " << job->id << " cancelled: " << e.what()
              << std::endl;
    job_repo.mark_failed(job->id, e.what());
  } catch (const std::exception& e) {
    std::string stage = "received";
    if (auto current = job_repo.get_job(job->id)) {
      stage = to_string(current->stage);
    }
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing job " << job->id << " in stage "
              << stage << ": " << e.what() << std::endl;
    job_repo.mark_failed(job->id, stage + ": " + e.what());
  }
  return true;
}
}  // namespace async
}  // namespace sift_core
