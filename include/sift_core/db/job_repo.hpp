#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sift_core/db/database_manager.hpp"
#include "sift_core/db/job.hpp"
#include "sift_core/db/models/new_job_dto.hpp"
#include "sift_core/errors.hpp"

namespace sift_core {

class JobRepoError : public StorageError {
 public:
  explicit JobRepoError(const std::string& message) : StorageError(message) {}
};

class JobRepo {
 public:
  explicit JobRepo(DatabaseManager& db_manager);

  long long create_job(const NewJobDTO& job);

  /*
  Claims the oldest PENDING job whose (knowledge_base, origin) has no job in PROCESSING and moves it
  to PROCESSING, inside one IMMEDIATE transaction. Two workers can never hold jobs for the same
  document at once.
  */
  std::optional<Job> fetch_and_claim_next_job();

  std::optional<Job> get_job(long long job_id);
  std::optional<long long> find_pending_job(const std::string& knowledge_base,
                                            const std::string& origin,
                                            const std::string& content_hash);
  std::vector<Job> get_jobs_by_status(JobStatus status);
  std::vector<Job> list_jobs(int limit = 100);

  // Decompressed submission content; throws JobRepoError once the payload has been dropped.
  std::string load_payload(long long job_id);

  void update_stage(long long job_id, IngestionStage stage);
  // Never lowers the stored progress.
  void update_progress(long long job_id, double progress);
  void set_document(long long job_id, int64_t document_id);
  void mark_completed(long long job_id);
  void mark_failed(long long job_id, const std::string& error_message);

  /*
  A PENDING job fails right away. A PROCESSING job gets its cancel flag set and fails at the next
  stage boundary. Returns false for unknown or already finished jobs.
  */
  bool request_cancel(long long job_id);
  bool is_cancel_requested(long long job_id);

  // Moves PROCESSING jobs left over from a previous run back to PENDING. Returns how many.
  int requeue_interrupted_jobs();
  void clear_finished_jobs(int older_than_days = 7);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace sift_core
