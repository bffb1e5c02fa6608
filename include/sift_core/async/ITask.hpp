#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace sift_core {
class ServiceProvider;

using ProgressUpdater = std::function<void(float, const std::string&)>;

class ITask {
 public:
  ITask(long long id,
        std::chrono::system_clock::time_point created_at,
        std::chrono::system_clock::time_point updated_at)
      : id_(id), created_at_(created_at), updated_at_(updated_at) {}

  virtual ~ITask() = default;

  virtual void execute(ServiceProvider& services, const ProgressUpdater& on_progress) = 0;

  virtual const char* get_type() const = 0;

  long long get_id() const {
    return id_;
  }

 protected:
  long long id_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::system_clock::time_point updated_at_;
};

using ITaskPtr = std::unique_ptr<ITask>;
}  // namespace sift_core
