#include "sift_core/db/job_repo.hpp"

#include <sqlite_modern_cpp.h>

#include "sift_core/db/pooled_connection.hpp"
#include "sift_core/db/sqlite_error_utils.hpp"
#include "sift_core/db/time_utils.hpp"
#include "sift_core/db/transaction.hpp"
#include "sift_core/services/compression_service.hpp"

namespace sift_core {

namespace {

constexpr const char* JOB_SELECT =
    "SELECT id, document_id, knowledge_base, origin, content_hash, class_hint, status, stage, "
    "progress, error_message, cancel_requested, created_at, updated_at FROM ingestion_jobs ";

auto job_reader(std::vector<Job>& out) {
  return [&out](long long id, std::optional<long long> document_id, std::string knowledge_base,
                std::string origin, std::string content_hash,
                std::optional<std::string> class_hint, std::string status, std::string stage,
                double progress, std::optional<std::string> error_message, int cancel_requested,
                std::string created_at, std::string updated_at) {
    Job job;
    job.id = id;
    if (document_id)
      job.document_id = *document_id;
    job.knowledge_base = std::move(knowledge_base);
    job.origin = std::move(origin);
    job.content_hash = std::move(content_hash);
    if (class_hint)
      job.class_hint = document_class_from_string(*class_hint);
    job.status = job_status_from_string(status);
    job.stage = ingestion_stage_from_string(stage);
    job.progress = progress;
    if (error_message)
      job.error_message = *error_message;
    job.cancel_requested = cancel_requested != 0;
    job.created_at = string_to_time_point(created_at);
    job.updated_at = string_to_time_point(updated_at);
    out.push_back(std::move(job));
  };
}

std::string now_string() {
  return time_point_to_string(std::chrono::system_clock::now());
}

}  // namespace

JobRepo::JobRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

long long JobRepo::create_job(const NewJobDTO& job) {
  std::vector<char> payload = CompressionService::compress(job.content);
  try {
    PooledConnection conn(db_manager_);
    std::string created_at_str = now_string();
    std::optional<std::string> class_hint;
    if (job.class_hint)
      class_hint = to_string(*job.class_hint);
    *conn << "INSERT INTO ingestion_jobs (knowledge_base, origin, content_hash, class_hint, "
             "payload, created_at, updated_at) VALUES (?,?,?,?,?,?,?)"
          << job.knowledge_base << job.origin << job.content_hash << class_hint << payload
          << created_at_str << created_at_str;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("create_job", e));
  }
}

std::optional<Job> JobRepo::fetch_and_claim_next_job() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    std::vector<Job> jobs;
    *conn << std::string(JOB_SELECT) +
                 "WHERE status = 'PENDING' AND NOT EXISTS ("
                 "  SELECT 1 FROM ingestion_jobs running WHERE running.status = 'PROCESSING'"
                 "  AND running.knowledge_base = ingestion_jobs.knowledge_base"
                 "  AND running.origin = ingestion_jobs.origin) "
                 "ORDER BY created_at ASC, id ASC LIMIT 1" >>
        job_reader(jobs);

    if (jobs.empty()) {
      tx.commit();
      return std::nullopt;
    }

    Job job = std::move(jobs.front());
    auto now = std::chrono::system_clock::now();
    *conn << "UPDATE ingestion_jobs SET status = ?, updated_at = ? WHERE id = ?"
          << to_string(JobStatus::PROCESSING) << time_point_to_string(now) << job.id;
    tx.commit();

    job.status = JobStatus::PROCESSING;
    job.updated_at = now;
    return job;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("fetch_and_claim_next_job", e));
  }
}

std::optional<Job> JobRepo::get_job(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<Job> jobs;
    *conn << std::string(JOB_SELECT) + "WHERE id = ?" << job_id >> job_reader(jobs);
    if (jobs.empty()) {
      return std::nullopt;
    }
    return jobs.front();
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("get_job", e));
  }
}

std::optional<long long> JobRepo::find_pending_job(const std::string& knowledge_base,
                                                   const std::string& origin,
                                                   const std::string& content_hash) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<long long> job_id;
    *conn << "SELECT id FROM ingestion_jobs WHERE status = 'PENDING' AND knowledge_base = ? "
             "AND origin = ? AND content_hash = ? ORDER BY id ASC LIMIT 1"
          << knowledge_base << origin << content_hash >>
        [&](long long id) { job_id = id; };
    return job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("find_pending_job", e));
  }
}

std::vector<Job> JobRepo::get_jobs_by_status(JobStatus status) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<Job> jobs;
    *conn << std::string(JOB_SELECT) + "WHERE status = ? ORDER BY created_at ASC, id ASC"
          << to_string(status) >>
        job_reader(jobs);
    return jobs;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("get_jobs_by_status", e));
  }
}

std::vector<Job> JobRepo::list_jobs(int limit) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<Job> jobs;
    *conn << std::string(JOB_SELECT) + "ORDER BY id DESC LIMIT ?" << limit >> job_reader(jobs);
    return jobs;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("list_jobs", e));
  }
}

std::string JobRepo::load_payload(long long job_id) {
  std::optional<std::vector<char>> payload;
  bool found = false;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT payload FROM ingestion_jobs WHERE id = ?" << job_id >>
        [&](std::optional<std::vector<char>> blob) {
          found = true;
          payload = std::move(blob);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("load_payload", e));
  }
  if (!found) {
    throw NotFoundError("Job with ID " + std::to_string(job_id) + " not found");
  }
  if (!payload) {
    throw JobRepoError("Payload for job " + std::to_string(job_id) + " is no longer available");
  }
  return CompressionService::decompress(*payload);
}

void JobRepo::update_stage(long long job_id, IngestionStage stage) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET stage = ?, updated_at = ? WHERE id = ?" << to_string(stage)
          << now_string() << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("update_stage", e));
  }
}

void JobRepo::update_progress(long long job_id, double progress) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET progress = MIN(1.0, MAX(progress, ?)), updated_at = ? "
             "WHERE id = ?"
          << progress << now_string() << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("update_progress", e));
  }
}

void JobRepo::set_document(long long job_id, int64_t document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET document_id = ?, updated_at = ? WHERE id = ?"
          << static_cast<long long>(document_id) << now_string() << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("set_document", e));
  }
}

void JobRepo::mark_completed(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET status = ?, stage = ?, progress = 1.0, payload = NULL, "
             "updated_at = ? WHERE id = ?"
          << to_string(JobStatus::COMPLETED) << to_string(IngestionStage::Completed)
          << now_string() << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("mark_completed", e));
  }
}

void JobRepo::mark_failed(long long job_id, const std::string& error_message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET status = ?, error_message = ?, payload = NULL, "
             "updated_at = ? WHERE id = ?"
          << to_string(JobStatus::FAILED) << error_message << now_string() << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("mark_failed", e));
  }
}

bool JobRepo::request_cancel(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    std::optional<JobStatus> status;
    *conn << "SELECT status FROM ingestion_jobs WHERE id = ?" << job_id >>
        [&](std::string status_db) { status = job_status_from_string(status_db); };
    if (!status) {
      tx.commit();
      return false;
    }

    const std::string now_str = now_string();
    bool accepted = false;
    if (*status == JobStatus::PENDING) {
      *conn << "UPDATE ingestion_jobs SET status = ?, cancel_requested = 1, error_message = ?, "
               "payload = NULL, updated_at = ? WHERE id = ?"
            << to_string(JobStatus::FAILED) << std::string("cancelled before processing started")
            << now_str << job_id;
      accepted = true;
    } else if (*status == JobStatus::PROCESSING) {
      *conn << "UPDATE ingestion_jobs SET cancel_requested = 1, updated_at = ? WHERE id = ?"
            << now_str << job_id;
      accepted = true;
    }
    tx.commit();
    return accepted;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("request_cancel", e));
  }
}

bool JobRepo::is_cancel_requested(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    int flag = 0;
    *conn << "SELECT cancel_requested FROM ingestion_jobs WHERE id = ?" << job_id >>
        [&](int value) { flag = value; };
    return flag != 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("is_cancel_requested", e));
  }
}

int JobRepo::requeue_interrupted_jobs() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET status = ?, stage = ?, updated_at = ? "
             "WHERE status = ?"
          << to_string(JobStatus::PENDING) << to_string(IngestionStage::Received) << now_string()
          << to_string(JobStatus::PROCESSING);
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("requeue_interrupted_jobs", e));
  }
}

void JobRepo::clear_finished_jobs(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    auto cutoff_time = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    *conn << "DELETE FROM ingestion_jobs WHERE status IN (?, ?) AND updated_at <= ?"
          << to_string(JobStatus::COMPLETED) << to_string(JobStatus::FAILED)
          << time_point_to_string(cutoff_time);
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("clear_finished_jobs", e));
  }
}

}  // namespace sift_core
