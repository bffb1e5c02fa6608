#include "sift_core/services/background/maintenance_service.hpp"

#include <iostream>

namespace sift_core {
namespace background {

MaintenanceService::MaintenanceService(std::shared_ptr<StorageService> storage,
                                       std::shared_ptr<JobRepo> job_repo,
                                       const MaintenanceSettings& settings)
    : storage_(std::move(storage)), job_repo_(std::move(job_repo)), settings_(settings) {}

MaintenanceService::~MaintenanceService() {
  stop();
}

void MaintenanceService::start() {
  if (running_.exchange(true)) {
    std::cerr << "Warning: MaintenanceService is already running." << std::endl;
    return;
  }
  worker_ = std::make_unique<std::thread>(&MaintenanceService::maintenance_loop, this);
}

void MaintenanceService::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wake_.notify_all();
  if (worker_ && worker_->joinable()) {
    worker_->join();
  }
  worker_.reset();
}

bool MaintenanceService::is_running() const {
  return running_.load();
}

size_t MaintenanceService::run_once() {
  size_t purged = storage_->purge_deleted(settings_.retention);
  job_repo_->clear_finished_jobs(settings_.finished_job_retention_days);
  if (purged > 0) {
    std::cout << "Maintenance: purged " << purged << " superseded chunks" << std::endl;
  }
  return purged;
}

void MaintenanceService::maintenance_loop() {
  while (running_.load()) {
    try {
      run_once();
    } catch (const std::exception& e) {
      std::cerr << "Warning: Maintenance pass failed: " << e.what() << std::endl;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, settings_.interval, [this]() { return !running_.load(); });
  }
}

}  // namespace background
}  // namespace sift_core
