#include "sift_core/services/storage_service.hpp"

#include <iostream>
#include <mutex>

namespace sift_core {

StorageService::StorageService(std::shared_ptr<MetadataStore> metadata_store,
                               std::shared_ptr<VectorStore> vector_store)
    : metadata_store_(std::move(metadata_store)), vector_store_(std::move(vector_store)) {}

void StorageService::initialize() {
  const int configured = vector_store_->dimensions();
  auto stored = metadata_store_->get_index_dimensions();
  if (stored && *stored != configured) {
    throw ConfigurationError("Embedding dimension mismatch: index holds " +
                             std::to_string(*stored) + "-dimensional vectors, embedder is " +
                             "configured for " + std::to_string(configured));
  }
  if (!stored) {
    metadata_store_->set_index_dimensions(configured);
  }

  std::unique_lock lock(switch_mutex_);
  vector_store_->clear();
  std::vector<VectorRecord> records;
  for (auto &row : metadata_store_->load_live_embeddings()) {
    if (row.vector.size() != static_cast<size_t>(configured)) {
      std::cerr << "Warning: Skipping chunk ID " << row.chunk_id
                << " during index rebuild due to mismatched vector dimension. Expected "
                << configured << ", got " << row.vector.size() << "." << std::endl;
      continue;
    }
    VectorRecord record;
    record.chunk_id = row.chunk_id;
    record.document_id = row.document_id;
    record.version = row.version;
    record.knowledge_base = std::move(row.knowledge_base);
    record.doc_class = row.doc_class;
    record.language = std::move(row.language);
    record.created_at = row.created_at;
    record.vector = std::move(row.vector);
    records.push_back(std::move(record));
  }
  vector_store_->upsert(records, /*visible*/ true);
  std::cout << "Vector index rebuilt with " << records.size() << " vectors" << std::endl;
}

void StorageService::validate(const NewVersion &version) const {
  if (version.origin.empty()) {
    throw ValidationError("Document origin must not be empty");
  }
  if (version.chunks.empty()) {
    throw ValidationError("A document version needs at least one chunk");
  }
  if (version.embeddings.size() != version.chunks.size()) {
    throw ValidationError("Got " + std::to_string(version.embeddings.size()) +
                          " embeddings for " + std::to_string(version.chunks.size()) + " chunks");
  }
  for (const auto &embedding : version.embeddings) {
    if (embedding.size() != static_cast<size_t>(vector_store_->dimensions())) {
      throw ValidationError("Embedding has " + std::to_string(embedding.size()) +
                            " dimensions, index expects " +
                            std::to_string(vector_store_->dimensions()));
    }
  }
}

CommitResult StorageService::commit_version(const NewVersion &version) {
  validate(version);

  VersionWrite write;
  write.knowledge_base = version.knowledge_base;
  write.origin = version.origin;
  write.content_hash = version.content_hash;
  write.doc_class = version.doc_class;
  write.chunks.reserve(version.chunks.size());
  for (size_t i = 0; i < version.chunks.size(); ++i) {
    write.chunks.push_back({version.chunks[i], version.embeddings[i]});
  }

  std::unique_lock switch_lock(switch_mutex_, std::defer_lock);
  std::vector<int64_t> staged_ids;

  auto stage_vectors = [&](const VersionWriteResult &written) {
    std::vector<VectorRecord> records;
    records.reserve(written.chunk_ids.size());
    for (size_t i = 0; i < written.chunk_ids.size(); ++i) {
      const Chunk &chunk = version.chunks[i];
      VectorRecord record;
      record.chunk_id = written.chunk_ids[i];
      record.document_id = written.document_id;
      record.version = written.version;
      record.knowledge_base = version.knowledge_base;
      record.doc_class = chunk.doc_class;
      record.language = chunk.language;
      record.created_at = written.created_at;
      record.vector = version.embeddings[i];
      records.push_back(std::move(record));
    }
    vector_store_->upsert(records, /*visible*/ false);
    staged_ids = written.chunk_ids;
    // Held from COMMIT until the new vectors are published
    switch_lock.lock();
  };

  VersionWriteResult written;
  try {
    written = metadata_store_->write_version(write, stage_vectors);
  } catch (const SiftError &) {
    vector_store_->remove(staged_ids);
    throw;
  } catch (const std::exception &e) {
    vector_store_->remove(staged_ids);
    throw StorageError(std::string("Version switch failed: ") + e.what());
  }

  CommitResult result;
  result.unchanged = written.unchanged;
  result.document_id = written.document_id;
  result.version = written.version;
  if (written.unchanged) {
    return result;
  }

  vector_store_->publish(written.chunk_ids);
  vector_store_->mark_deleted(written.superseded_chunk_ids);
  switch_lock.unlock();

  result.chunk_ids = written.chunk_ids;
  result.superseded_chunks = written.superseded_chunk_ids.size();
  return result;
}

StorageService::Snapshot StorageService::acquire_snapshot() const {
  return Snapshot(switch_mutex_);
}

std::vector<int64_t> StorageService::remove_document(int64_t document_id) {
  // Same order as commit_version: the SQLite write lock first, then the switch lock
  std::unique_lock switch_lock(switch_mutex_, std::defer_lock);
  auto chunk_ids = metadata_store_->delete_document(
      document_id, [&](const std::vector<int64_t> &) { switch_lock.lock(); });
  vector_store_->remove(chunk_ids);
  return chunk_ids;
}

size_t StorageService::remove_by_origin_prefix(const std::string &knowledge_base,
                                               const std::string &prefix) {
  auto document_ids = metadata_store_->find_documents_by_origin_prefix(knowledge_base, prefix);
  size_t removed = 0;
  for (int64_t document_id : document_ids) {
    try {
      remove_document(document_id);
      ++removed;
    } catch (const NotFoundError &) {
      // Removed concurrently
    }
  }
  return removed;
}

size_t StorageService::purge_deleted(std::chrono::hours retention) {
  auto cutoff = std::chrono::system_clock::now() - retention;
  std::unique_lock switch_lock(switch_mutex_, std::defer_lock);
  auto purged = metadata_store_->purge_deleted_chunks(
      cutoff, [&](const std::vector<int64_t> &) { switch_lock.lock(); });
  vector_store_->remove(purged);
  return purged.size();
}

}  // namespace sift_core
