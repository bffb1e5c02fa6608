#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "sift_core/types/document_class.hpp"

namespace sift_core {

enum class JobStatus { PENDING, PROCESSING, COMPLETED, FAILED };

inline std::string to_string(JobStatus status) {
  switch (status) {
    case JobStatus::PENDING: return "PENDING";
    case JobStatus::PROCESSING: return "PROCESSING";
    case JobStatus::COMPLETED: return "COMPLETED";
    case JobStatus::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

inline JobStatus job_status_from_string(const std::string &str) {
  if (str == "PENDING") return JobStatus::PENDING;
  if (str == "PROCESSING") return JobStatus::PROCESSING;
  if (str == "COMPLETED") return JobStatus::COMPLETED;
  if (str == "FAILED") return JobStatus::FAILED;
  throw std::invalid_argument("Invalid JobStatus string: " + str);
}

// Pipeline stage a job reached; a failed job keeps the stage it failed in.
enum class IngestionStage { Received, Classifying, Chunking, Embedding, Indexing, Completed };

inline std::string to_string(IngestionStage stage) {
  switch (stage) {
    case IngestionStage::Received: return "received";
    case IngestionStage::Classifying: return "classifying";
    case IngestionStage::Chunking: return "chunking";
    case IngestionStage::Embedding: return "embedding";
    case IngestionStage::Indexing: return "indexing";
    case IngestionStage::Completed: return "completed";
  }
  return "unknown";
}

inline IngestionStage ingestion_stage_from_string(const std::string &str) {
  if (str == "received") return IngestionStage::Received;
  if (str == "classifying") return IngestionStage::Classifying;
  if (str == "chunking") return IngestionStage::Chunking;
  if (str == "embedding") return IngestionStage::Embedding;
  if (str == "indexing") return IngestionStage::Indexing;
  if (str == "completed") return IngestionStage::Completed;
  throw std::invalid_argument("Invalid IngestionStage string: " + str);
}

struct Job {
  long long id = 0;
  std::optional<int64_t> document_id;
  std::string knowledge_base;
  std::string origin;
  std::string content_hash;
  std::optional<DocumentClass> class_hint;
  JobStatus status = JobStatus::PENDING;
  IngestionStage stage = IngestionStage::Received;
  double progress = 0.0;
  std::string error_message;
  bool cancel_requested = false;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

}  // namespace sift_core
