#include "sift_core/async/task_factory.hpp"

#include <stdexcept>

namespace sift_core {
ITaskPtr TaskFactory::create_task(const Job& record) {
  if (record.origin.empty()) {
    throw std::runtime_error("Ingestion job " + std::to_string(record.id) +
                             " is missing its origin.");
  }
  if (record.content_hash.empty()) {
    throw std::runtime_error("Ingestion job " + std::to_string(record.id) +
                             " is missing its content hash.");
  }
  return std::make_unique<IngestDocumentTask>(record);
}
}  // namespace sift_core
