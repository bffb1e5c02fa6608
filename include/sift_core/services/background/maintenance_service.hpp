#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "sift_core/db/job_repo.hpp"
#include "sift_core/services/storage_service.hpp"
#include "sift_core/settings.hpp"

namespace sift_core {
namespace background {

// Periodically purges soft-deleted chunks past retention and clears old finished jobs.
class MaintenanceService {
 public:
  MaintenanceService(std::shared_ptr<StorageService> storage,
                     std::shared_ptr<JobRepo> job_repo,
                     const MaintenanceSettings& settings);
  ~MaintenanceService();

  void start();
  void stop();
  bool is_running() const;

  // One maintenance pass on the calling thread. Returns the number of purged chunks.
  size_t run_once();

 private:
  void maintenance_loop();

  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<JobRepo> job_repo_;
  MaintenanceSettings settings_;
  std::unique_ptr<std::thread> worker_;
  std::atomic<bool> running_{false};
  std::mutex mutex_;
  std::condition_variable wake_;
};

}  // namespace background
}  // namespace sift_core
