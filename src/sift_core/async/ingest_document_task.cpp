#include "sift_core/async/ingest_document_task.hpp"

#include <algorithm>

#include "sift_core/async/service_provider.hpp"
#include "sift_core/chunking/chunker.hpp"
#include "sift_core/classify/classifier.hpp"
#include "sift_core/db/job_repo.hpp"
#include "sift_core/embedding/embedder.hpp"
#include "sift_core/services/storage_service.hpp"

namespace sift_core {

namespace {
constexpr float PROGRESS_CLASSIFYING = 0.05f;
constexpr float PROGRESS_CHUNKING = 0.15f;
constexpr float PROGRESS_EMBEDDING = 0.25f;
constexpr float PROGRESS_EMBEDDING_SPAN = 0.6f;
constexpr float PROGRESS_INDEXING = 0.9f;
}  // namespace

IngestDocumentTask::IngestDocumentTask(const Job& job)
    : ITask(job.id, job.created_at, job.updated_at), job_(job) {}

std::string_view IngestDocumentTask::sample_of(std::string_view content, size_t max_bytes) {
  if (content.size() <= max_bytes) {
    return content;
  }
  size_t end = max_bytes;
  // Back off continuation bytes
  while (end > 0 && (static_cast<unsigned char>(content[end]) & 0xC0) == 0x80) {
    --end;
  }
  return content.substr(0, end);
}

void IngestDocumentTask::enter_stage(JobRepo& jobs,
                                     IngestionStage stage,
                                     float progress,
                                     const ProgressUpdater& on_progress) {
  if (jobs.is_cancel_requested(id_)) {
    throw JobCancelledError("Job cancelled before " + to_string(stage));
  }
  jobs.update_stage(id_, stage);
  stage_ = stage;
  on_progress(progress, "Stage " + to_string(stage));
}

void IngestDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  JobRepo& jobs = services.get_job_repo();
  StorageService& storage = services.get_storage();
  on_progress(0.0f, "Received");

  std::string content = jobs.load_payload(id_);

  // 1. Same content as the current version: nothing to do
  auto existing = storage.metadata().get_document_by_origin(job_.knowledge_base, job_.origin);
  if (existing && existing->content_hash == job_.content_hash) {
    jobs.set_document(id_, existing->id);
    on_progress(1.0f, "Content unchanged, version " + std::to_string(existing->current_version) +
                          " kept");
    return;
  }

  // 2. Classify
  enter_stage(jobs, IngestionStage::Classifying, PROGRESS_CLASSIFYING, on_progress);
  DocumentClass doc_class;
  if (job_.class_hint) {
    doc_class = *job_.class_hint;
  } else {
    doc_class = services.get_classifier().classify(
        sample_of(content, services.get_classifier_sample_bytes()), job_.origin);
  }

  // 3. Chunk
  enter_stage(jobs, IngestionStage::Chunking, PROGRESS_CHUNKING, on_progress);
  ChunkContext context;
  context.origin = job_.origin;
  std::vector<Chunk> chunks = services.get_chunker().chunk(content, doc_class, context);

  // 4. Embed
  enter_stage(jobs, IngestionStage::Embedding, PROGRESS_EMBEDDING, on_progress);
  std::vector<std::vector<float>> embeddings = embed_chunks(chunks, services, on_progress);

  // 5. Switch to the new version
  enter_stage(jobs, IngestionStage::Indexing, PROGRESS_INDEXING, on_progress);
  NewVersion version;
  version.knowledge_base = job_.knowledge_base;
  version.origin = job_.origin;
  version.content_hash = job_.content_hash;
  version.doc_class = doc_class;
  version.chunks = std::move(chunks);
  version.embeddings = std::move(embeddings);
  CommitResult result = storage.commit_version(version);

  jobs.set_document(id_, result.document_id);
  if (result.unchanged) {
    on_progress(1.0f, "Content unchanged");
  } else {
    on_progress(1.0f, "Indexed version " + std::to_string(result.version) + " with " +
                          std::to_string(result.chunk_ids.size()) + " chunks");
  }
}

std::vector<std::vector<float>> IngestDocumentTask::embed_chunks(
    const std::vector<Chunk>& chunks,
    ServiceProvider& services,
    const ProgressUpdater& on_progress) {
  Embedder& embedder = services.get_embedder();
  const size_t group_size = std::max<size_t>(1, services.get_ingestion_settings().embed_group_size);

  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(chunks.size());
  for (size_t begin = 0; begin < chunks.size(); begin += group_size) {
    if (begin > 0 && services.get_job_repo().is_cancel_requested(id_)) {
      throw JobCancelledError("Job cancelled during " + to_string(stage_));
    }
    const size_t end = std::min(chunks.size(), begin + group_size);
    std::vector<std::string> texts;
    texts.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      texts.push_back(chunks[i].content);
    }
    auto vectors = embedder.embed_batch(texts);
    for (auto& vector : vectors) {
      embeddings.push_back(std::move(vector));
    }

    float progress = PROGRESS_EMBEDDING +
                     PROGRESS_EMBEDDING_SPAN * (static_cast<float>(end) / chunks.size());
    on_progress(progress, "Embedded chunk " + std::to_string(end) + " of " +
                              std::to_string(chunks.size()));
  }
  return embeddings;
}

}  // namespace sift_core
