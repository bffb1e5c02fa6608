#pragma once

#include "sift_core/async/ITask.hpp"
#include "sift_core/async/ingest_document_task.hpp"

namespace sift_core {
class TaskFactory {
 public:
  static ITaskPtr create_task(const Job& record);
};
}  // namespace sift_core
