#include <gtest/gtest.h>

#include <cctype>
#include <memory>
#include <string>

#include "../../common/utilities_test.hpp"
#include "sift_core/services/hash_service.hpp"
#include "sift_core/services/ingestion_service.hpp"

namespace sift_tests {

using namespace sift_core;

class IngestionServiceTest : public MetadataStoreTestBase {
 protected:
  void SetUp() override {
    MetadataStoreTestBase::SetUp();
    settings_.max_content_bytes = 1024;
    service_ = std::make_unique<IngestionService>(job_repo_, settings_);
  }

  static IngestRequest request(const std::string& origin, const std::string& content) {
    IngestRequest req;
    req.origin = origin;
    req.content = content;
    return req;
  }

  IngestionSettings settings_;
  std::unique_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, Submit_QueuesPendingJob) {
  auto req = request("notes/today.md", "# Today\n\nShip the release.");
  req.knowledge_base = "team";
  req.class_hint = DocumentClass::Markdown;

  long long id = service_->submit(req);

  Job job = service_->get_job_status(id);
  EXPECT_EQ(job.status, JobStatus::PENDING);
  EXPECT_EQ(job.stage, IngestionStage::Received);
  EXPECT_EQ(job.knowledge_base, "team");
  EXPECT_EQ(job.origin, "notes/today.md");
  EXPECT_EQ(job.content_hash, HashService::sha256_hex(req.content));
  EXPECT_EQ(job.class_hint, DocumentClass::Markdown);
  EXPECT_EQ(job_repo_->load_payload(id), req.content);
}

TEST_F(IngestionServiceTest, Submit_DefaultsKnowledgeBase) {
  long long id = service_->submit(request("a.txt", "alpha"));
  EXPECT_EQ(service_->get_job_status(id).knowledge_base, DEFAULT_KNOWLEDGE_BASE);
}

TEST_F(IngestionServiceTest, Submit_ReusesPendingJobForSameContent) {
  long long first = service_->submit(request("a.txt", "alpha"));
  long long again = service_->submit(request("a.txt", "alpha"));
  long long changed = service_->submit(request("a.txt", "beta"));

  EXPECT_EQ(first, again);
  EXPECT_NE(first, changed);
  EXPECT_EQ(job_repo_->get_jobs_by_status(JobStatus::PENDING).size(), 2);
}

TEST_F(IngestionServiceTest, Submit_ClaimedJobIsNotReused) {
  long long first = service_->submit(request("a.txt", "alpha"));
  job_repo_->fetch_and_claim_next_job();

  EXPECT_NE(service_->submit(request("a.txt", "alpha")), first);
}

TEST_F(IngestionServiceTest, Submit_AcceptsMatchingHashInAnyCase) {
  auto req = request("a.txt", "alpha");
  std::string hash = HashService::sha256_hex("alpha");
  for (auto& c : hash) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  req.content_hash = hash;

  EXPECT_NO_THROW(service_->submit(req));
}

TEST_F(IngestionServiceTest, Submit_RejectsInvalidRequests) {
  EXPECT_THROW(service_->submit(request("", "alpha")), ValidationError);
  EXPECT_THROW(service_->submit(request("a.txt", "")), ValidationError);
  EXPECT_THROW(service_->submit(request("a.txt", " \n\t ")), ValidationError);
  EXPECT_THROW(service_->submit(request("a.txt", std::string(2048, 'x'))), ValidationError);
  EXPECT_THROW(service_->submit(request("a.txt", std::string("bad \xC3\x28 byte"))),
               ValidationError);

  auto wrong_hash = request("a.txt", "alpha");
  wrong_hash.content_hash = HashService::sha256_hex("beta");
  EXPECT_THROW(service_->submit(wrong_hash), ValidationError);

  auto blank_kb = request("a.txt", "alpha");
  blank_kb.knowledge_base = "  ";
  EXPECT_THROW(service_->submit(blank_kb), ValidationError);

  EXPECT_TRUE(job_repo_->list_jobs().empty());
}

TEST_F(IngestionServiceTest, GetJobStatus_UnknownJobThrows) {
  EXPECT_THROW(service_->get_job_status(9999), NotFoundError);
}

TEST_F(IngestionServiceTest, Cancel_PendingJobFails) {
  long long id = service_->submit(request("a.txt", "alpha"));

  EXPECT_TRUE(service_->cancel(id));

  Job job = service_->get_job_status(id);
  EXPECT_EQ(job.status, JobStatus::FAILED);
  EXPECT_TRUE(job.cancel_requested);
}

TEST_F(IngestionServiceTest, Cancel_FinishedJobReturnsFalse) {
  long long id = service_->submit(request("a.txt", "alpha"));
  job_repo_->fetch_and_claim_next_job();
  job_repo_->mark_completed(id);

  EXPECT_FALSE(service_->cancel(id));
  EXPECT_THROW(service_->cancel(9999), NotFoundError);
}

TEST_F(IngestionServiceTest, ListJobs_FiltersByStatusAndLimits) {
  long long a = service_->submit(request("a.txt", "alpha"));
  service_->submit(request("b.txt", "beta"));
  service_->submit(request("c.txt", "gamma"));
  job_repo_->fetch_and_claim_next_job();

  auto processing = service_->list_jobs(JobStatus::PROCESSING);
  ASSERT_EQ(processing.size(), 1);
  EXPECT_EQ(processing[0].id, a);

  EXPECT_EQ(service_->list_jobs(std::nullopt, 2).size(), 2);
  EXPECT_EQ(service_->list_jobs(JobStatus::PENDING, 1).size(), 1);
  EXPECT_THROW(service_->list_jobs(std::nullopt, 0), ValidationError);
}

}  // namespace sift_tests
