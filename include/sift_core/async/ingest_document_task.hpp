#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sift_core/async/ITask.hpp"
#include "sift_core/db/job.hpp"
#include "sift_core/types/chunk.hpp"

namespace sift_core {
class JobRepo;

/*
Runs one job through received -> classifying -> chunking -> embedding -> indexing. Nothing reaches
storage before indexing, and indexing is a single atomic version switch, so a failed or cancelled
run leaves no visible data. Cancellation is honoured at every stage boundary.
*/
class IngestDocumentTask : public ITask {
 public:
  explicit IngestDocumentTask(const Job& job);

  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override {
    return "INGEST_DOCUMENT";
  }

  const Job& get_job() const {
    return job_;
  }

  // Longest prefix of at most max_bytes that does not split a UTF-8 sequence.
  static std::string_view sample_of(std::string_view content, size_t max_bytes);

 private:
  void enter_stage(JobRepo& jobs, IngestionStage stage, float progress,
                   const ProgressUpdater& on_progress);
  std::vector<std::vector<float>> embed_chunks(const std::vector<Chunk>& chunks,
                                               ServiceProvider& services,
                                               const ProgressUpdater& on_progress);

  Job job_;
  IngestionStage stage_ = IngestionStage::Received;
};
}  // namespace sift_core
