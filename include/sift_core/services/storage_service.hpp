#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "sift_core/db/metadata_store.hpp"
#include "sift_core/vector/vector_store.hpp"

namespace sift_core {

struct NewVersion {
  std::string knowledge_base = DEFAULT_KNOWLEDGE_BASE;
  std::string origin;
  std::string content_hash;
  DocumentClass doc_class = DocumentClass::Mixed;
  std::vector<Chunk> chunks;
  std::vector<std::vector<float>> embeddings;  // parallel to chunks
};

struct CommitResult {
  bool unchanged = false;
  int64_t document_id = 0;
  int version = 0;
  std::vector<int64_t> chunk_ids;
  size_t superseded_chunks = 0;
};

/*
Keeps the relational store and the vector index in step. A new document version becomes visible to
queries in one step: its vectors are staged hidden while the SQLite transaction is open, and the
commit, the publish of the new vectors and the hiding of the superseded ones all happen under the
exclusive side of the switch lock. Queries hold the shared side for their whole read, so they see
either the old version or the new one, never both.

Every writer takes the SQLite write lock first and the switch lock second, from inside the open
transaction.
*/
class StorageService {
 public:
  using Snapshot = std::shared_lock<std::shared_mutex>;

  StorageService(std::shared_ptr<MetadataStore> metadata_store,
                 std::shared_ptr<VectorStore> vector_store);

  // Checks the persisted embedding dimension and rebuilds the vector index from SQLite.
  void initialize();

  CommitResult commit_version(const NewVersion &version);

  // Holds off version switches until released.
  Snapshot acquire_snapshot() const;

  std::vector<int64_t> remove_document(int64_t document_id);
  size_t remove_by_origin_prefix(const std::string &knowledge_base, const std::string &prefix);
  // Physically drops chunks superseded longer than the retention period ago.
  size_t purge_deleted(std::chrono::hours retention);

  MetadataStore &metadata() {
    return *metadata_store_;
  }
  VectorStore &vectors() {
    return *vector_store_;
  }

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<VectorStore> vector_store_;
  mutable std::shared_mutex switch_mutex_;

  void validate(const NewVersion &version) const;
};

}  // namespace sift_core
