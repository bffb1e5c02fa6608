#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sift_core/errors.hpp"
#include "sift_core/types/search.hpp"

namespace sift_core {

class VectorStoreError : public StorageError {
 public:
  explicit VectorStoreError(const std::string &message) : StorageError(message) {}
};

// One chunk embedding plus the metadata the index filters on.
struct VectorRecord {
  int64_t chunk_id = 0;
  int64_t document_id = 0;
  int version = 0;
  std::string knowledge_base;
  DocumentClass doc_class = DocumentClass::Text;
  std::string language;
  std::chrono::system_clock::time_point created_at;
  std::vector<float> vector;
};

struct VectorFilter {
  SearchFilters filters;
  std::vector<int64_t> exclude_document_ids;
};

struct VectorHit {
  int64_t chunk_id;
  float score;  // cosine similarity
};

/*
In-memory cosine index over chunk embeddings. Vectors are L2-normalized on the way in and searched
by inner product. Every record carries a visibility flag so a new document version can be staged
before its transaction commits and published afterwards, and a deleted flag so superseded chunks
drop out of results until they are purged.
*/
class VectorStore {
 public:
  explicit VectorStore(int dimensions);
  ~VectorStore();

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  // Replaces existing records with the same chunk ids.
  void upsert(const std::vector<VectorRecord> &records, bool visible = true);
  void publish(const std::vector<int64_t> &chunk_ids);
  void mark_deleted(const std::vector<int64_t> &chunk_ids);
  void remove(const std::vector<int64_t> &chunk_ids);
  void clear();

  // Top-k visible, non-deleted records passing the filter, best first, ties by chunk id.
  std::vector<VectorHit> search(const std::vector<float> &query,
                                size_t k,
                                const VectorFilter &filter = {}) const;

  size_t size() const;
  size_t searchable_size() const;
  int dimensions() const {
    return dimensions_;
  }

 private:
  struct Entry {
    int64_t document_id;
    int version;
    std::string knowledge_base;
    DocumentClass doc_class;
    std::string language;
    std::chrono::system_clock::time_point created_at;
    bool visible;
    bool deleted;
  };

  class FilterSelector;

  int dimensions_;
  std::unique_ptr<faiss::IndexIDMap2> index_;
  std::unordered_map<int64_t, Entry> entries_;
  mutable std::shared_mutex mutex_;

  void validate_vector_dimension(const std::vector<float> &vector) const;
  void remove_locked(const std::vector<int64_t> &chunk_ids);
  static bool matches(const Entry &entry, const VectorFilter &filter);
};

}  // namespace sift_core
