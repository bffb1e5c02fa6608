#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/db/job.hpp"
#include "sift_core/db/job_repo.hpp"
#include "sift_core/settings.hpp"

namespace sift_core {

struct IngestRequest {
  std::string content;
  std::string origin;
  std::optional<std::string> knowledge_base;
  std::optional<std::string> content_hash;  // SHA-256 hex, checked against the content
  std::optional<DocumentClass> class_hint;
};

// Entry point of the ingestion pipeline: validates submissions and queues them for the workers.
class IngestionService {
 public:
  IngestionService(std::shared_ptr<JobRepo> job_repo, const IngestionSettings& settings);

  /**
   * @brief Queues content for ingestion and returns the job id.
   *
   * A pending job for the same document and content is reused instead of queueing a second one.
   * @throw ValidationError for empty or non-UTF-8 content, a missing origin, oversized content or
   * a supplied hash that does not match the content.
   */
  long long submit(const IngestRequest& request);

  // Throws NotFoundError for unknown ids.
  Job get_job_status(long long job_id);

  /**
   * @brief Cancels a job: pending jobs fail at once, running ones at their next stage boundary.
   * @return false if the job had already finished.
   * @throw NotFoundError for unknown ids.
   */
  bool cancel(long long job_id);

  std::vector<Job> list_jobs(std::optional<JobStatus> status = std::nullopt, int limit = 100);

 private:
  std::shared_ptr<JobRepo> job_repo_;
  IngestionSettings settings_;
};

}  // namespace sift_core
