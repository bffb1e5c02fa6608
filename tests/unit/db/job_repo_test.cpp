#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "sift_core/db/job_repo.hpp"

namespace sift_core {

class JobRepoTest : public sift_tests::MetadataStoreTestBase {
 protected:
  long long submit(const std::string& origin,
                   const std::string& content = "payload text",
                   const std::string& knowledge_base = DEFAULT_KNOWLEDGE_BASE) {
    NewJobDTO job;
    job.knowledge_base = knowledge_base;
    job.origin = origin;
    job.content_hash = "hash-" + origin + "-" + content;
    job.content = content;
    return job_repo_->create_job(job);
  }
};

TEST_F(JobRepoTest, CreateJob_StartsPendingAtReceived) {
  NewJobDTO dto;
  dto.knowledge_base = "kb";
  dto.origin = "notes.md";
  dto.content_hash = "abc";
  dto.class_hint = DocumentClass::Markdown;
  dto.content = "# Notes";
  long long id = job_repo_->create_job(dto);

  auto job = job_repo_->get_job(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::PENDING);
  EXPECT_EQ(job->stage, IngestionStage::Received);
  EXPECT_DOUBLE_EQ(job->progress, 0.0);
  EXPECT_EQ(job->knowledge_base, "kb");
  EXPECT_EQ(job->class_hint, DocumentClass::Markdown);
  EXPECT_FALSE(job->document_id.has_value());
  EXPECT_FALSE(job->cancel_requested);
  EXPECT_EQ(job_repo_->load_payload(id), "# Notes");
}

TEST_F(JobRepoTest, GetJob_UnknownIdIsEmpty) {
  EXPECT_FALSE(job_repo_->get_job(424242).has_value());
  EXPECT_THROW(job_repo_->load_payload(424242), NotFoundError);
}

TEST_F(JobRepoTest, FetchAndClaim_OldestFirst) {
  long long first = submit("a.txt");
  long long second = submit("b.txt");

  auto claimed = job_repo_->fetch_and_claim_next_job();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, first);
  EXPECT_EQ(claimed->status, JobStatus::PROCESSING);
  EXPECT_EQ(job_repo_->get_job(first)->status, JobStatus::PROCESSING);

  auto next = job_repo_->fetch_and_claim_next_job();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->id, second);

  EXPECT_FALSE(job_repo_->fetch_and_claim_next_job().has_value());
}

TEST_F(JobRepoTest, FetchAndClaim_SkipsOriginAlreadyProcessing) {
  long long first = submit("same.txt", "v1");
  long long second = submit("same.txt", "v2");
  long long other = submit("other.txt");

  EXPECT_EQ(job_repo_->fetch_and_claim_next_job()->id, first);
  // second waits for first to finish
  EXPECT_EQ(job_repo_->fetch_and_claim_next_job()->id, other);
  EXPECT_FALSE(job_repo_->fetch_and_claim_next_job().has_value());

  job_repo_->mark_completed(first);
  EXPECT_EQ(job_repo_->fetch_and_claim_next_job()->id, second);
}

TEST_F(JobRepoTest, FetchAndClaim_SameOriginInOtherKnowledgeBaseRunsConcurrently) {
  long long a = submit("same.txt", "x", "kb-one");
  long long b = submit("same.txt", "x", "kb-two");

  EXPECT_EQ(job_repo_->fetch_and_claim_next_job()->id, a);
  EXPECT_EQ(job_repo_->fetch_and_claim_next_job()->id, b);
}

TEST_F(JobRepoTest, FindPendingJob_MatchesOriginAndHash) {
  long long id = submit("a.txt", "content");

  EXPECT_EQ(job_repo_->find_pending_job(DEFAULT_KNOWLEDGE_BASE, "a.txt", "hash-a.txt-content"),
            id);
  EXPECT_FALSE(job_repo_->find_pending_job(DEFAULT_KNOWLEDGE_BASE, "a.txt", "other").has_value());

  job_repo_->fetch_and_claim_next_job();
  EXPECT_FALSE(
      job_repo_->find_pending_job(DEFAULT_KNOWLEDGE_BASE, "a.txt", "hash-a.txt-content"));
}

TEST_F(JobRepoTest, UpdateProgress_NeverMovesBackwards) {
  long long id = submit("a.txt");

  job_repo_->update_progress(id, 0.5);
  job_repo_->update_progress(id, 0.25);
  EXPECT_DOUBLE_EQ(job_repo_->get_job(id)->progress, 0.5);

  job_repo_->update_progress(id, 3.0);
  EXPECT_DOUBLE_EQ(job_repo_->get_job(id)->progress, 1.0);
}

TEST_F(JobRepoTest, MarkCompleted_DropsPayloadAndFinishes) {
  long long id = submit("a.txt");
  job_repo_->fetch_and_claim_next_job();
  job_repo_->update_stage(id, IngestionStage::Indexing);

  job_repo_->mark_completed(id);

  auto job = job_repo_->get_job(id);
  EXPECT_EQ(job->status, JobStatus::COMPLETED);
  EXPECT_EQ(job->stage, IngestionStage::Completed);
  EXPECT_DOUBLE_EQ(job->progress, 1.0);
  EXPECT_THROW(job_repo_->load_payload(id), JobRepoError);
}

TEST_F(JobRepoTest, MarkFailed_KeepsStageAndMessage) {
  long long id = submit("a.txt");
  job_repo_->fetch_and_claim_next_job();
  job_repo_->update_stage(id, IngestionStage::Embedding);

  job_repo_->mark_failed(id, "embedding: provider unavailable");

  auto job = job_repo_->get_job(id);
  EXPECT_EQ(job->status, JobStatus::FAILED);
  EXPECT_EQ(job->stage, IngestionStage::Embedding);
  EXPECT_EQ(job->error_message, "embedding: provider unavailable");
}

TEST_F(JobRepoTest, RequestCancel_PendingJobFailsImmediately) {
  long long id = submit("a.txt");

  EXPECT_TRUE(job_repo_->request_cancel(id));

  auto job = job_repo_->get_job(id);
  EXPECT_EQ(job->status, JobStatus::FAILED);
  EXPECT_TRUE(job->cancel_requested);
  EXPECT_FALSE(job->error_message.empty());
  EXPECT_FALSE(job_repo_->fetch_and_claim_next_job().has_value());
}

TEST_F(JobRepoTest, RequestCancel_ProcessingJobOnlyGetsFlag) {
  long long id = submit("a.txt");
  job_repo_->fetch_and_claim_next_job();

  EXPECT_FALSE(job_repo_->is_cancel_requested(id));
  EXPECT_TRUE(job_repo_->request_cancel(id));

  EXPECT_TRUE(job_repo_->is_cancel_requested(id));
  EXPECT_EQ(job_repo_->get_job(id)->status, JobStatus::PROCESSING);
}

TEST_F(JobRepoTest, RequestCancel_FinishedOrUnknownJobIsRejected) {
  long long id = submit("a.txt");
  job_repo_->fetch_and_claim_next_job();
  job_repo_->mark_completed(id);

  EXPECT_FALSE(job_repo_->request_cancel(id));
  EXPECT_FALSE(job_repo_->request_cancel(987654));
  EXPECT_EQ(job_repo_->get_job(id)->status, JobStatus::COMPLETED);
}

TEST_F(JobRepoTest, RequeueInterruptedJobs_ReturnsProcessingToPending) {
  long long running = submit("a.txt");
  long long waiting = submit("b.txt");
  job_repo_->fetch_and_claim_next_job();
  job_repo_->update_stage(running, IngestionStage::Embedding);
  job_repo_->update_progress(running, 0.4);

  EXPECT_EQ(job_repo_->requeue_interrupted_jobs(), 1);

  auto job = job_repo_->get_job(running);
  EXPECT_EQ(job->status, JobStatus::PENDING);
  EXPECT_EQ(job->stage, IngestionStage::Received);
  EXPECT_DOUBLE_EQ(job->progress, 0.4);
  EXPECT_EQ(job_repo_->load_payload(running), "payload text");
  EXPECT_EQ(job_repo_->get_jobs_by_status(JobStatus::PENDING).size(), 2);
  EXPECT_EQ(job_repo_->get_job(waiting)->status, JobStatus::PENDING);
}

TEST_F(JobRepoTest, ListJobs_NewestFirstWithLimit) {
  submit("a.txt");
  submit("b.txt");
  long long newest = submit("c.txt");

  auto jobs = job_repo_->list_jobs(2);
  ASSERT_EQ(jobs.size(), 2);
  EXPECT_EQ(jobs[0].id, newest);
}

TEST_F(JobRepoTest, ClearFinishedJobs_KeepsActiveJobs) {
  long long done = submit("a.txt");
  long long pending = submit("b.txt");
  job_repo_->fetch_and_claim_next_job();
  job_repo_->mark_completed(done);

  job_repo_->clear_finished_jobs(0);

  EXPECT_FALSE(job_repo_->get_job(done).has_value());
  EXPECT_TRUE(job_repo_->get_job(pending).has_value());
}

}  // namespace sift_core
