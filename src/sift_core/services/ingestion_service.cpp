#include "sift_core/services/ingestion_service.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

#include "sift_core/services/hash_service.hpp"

namespace sift_core {

namespace {

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

}  // namespace

IngestionService::IngestionService(std::shared_ptr<JobRepo> job_repo,
                                   const IngestionSettings& settings)
    : job_repo_(std::move(job_repo)), settings_(settings) {}

long long IngestionService::submit(const IngestRequest& request) {
  if (is_blank(request.origin)) {
    throw ValidationError("origin is required");
  }
  if (is_blank(request.content)) {
    throw ValidationError("content must not be empty");
  }
  if (request.content.size() > settings_.max_content_bytes) {
    throw ValidationError("content exceeds " + std::to_string(settings_.max_content_bytes) +
                          " bytes");
  }
  if (!utf8::is_valid(request.content.begin(), request.content.end())) {
    throw ValidationError("content is not valid UTF-8");
  }
  const std::string knowledge_base = request.knowledge_base.value_or(DEFAULT_KNOWLEDGE_BASE);
  if (is_blank(knowledge_base)) {
    throw ValidationError("knowledge_base must not be empty");
  }

  const std::string content_hash = HashService::sha256_hex(request.content);
  if (request.content_hash && to_lower(*request.content_hash) != content_hash) {
    throw ValidationError("content_hash does not match the SHA-256 of the content");
  }

  if (auto pending = job_repo_->find_pending_job(knowledge_base, request.origin, content_hash)) {
    return *pending;
  }

  NewJobDTO job;
  job.knowledge_base = knowledge_base;
  job.origin = request.origin;
  job.content_hash = content_hash;
  job.class_hint = request.class_hint;
  job.content = request.content;
  return job_repo_->create_job(job);
}

Job IngestionService::get_job_status(long long job_id) {
  auto job = job_repo_->get_job(job_id);
  if (!job) {
    throw NotFoundError("Job " + std::to_string(job_id) + " not found");
  }
  return *job;
}

bool IngestionService::cancel(long long job_id) {
  if (!job_repo_->get_job(job_id)) {
    throw NotFoundError("Job " + std::to_string(job_id) + " not found");
  }
  return job_repo_->request_cancel(job_id);
}

std::vector<Job> IngestionService::list_jobs(std::optional<JobStatus> status, int limit) {
  if (limit <= 0) {
    throw ValidationError("limit must be positive");
  }
  std::vector<Job> jobs = status ? job_repo_->get_jobs_by_status(*status)
                                 : job_repo_->list_jobs(limit);
  if (jobs.size() > static_cast<size_t>(limit)) {
    jobs.resize(static_cast<size_t>(limit));
  }
  return jobs;
}

}  // namespace sift_core
