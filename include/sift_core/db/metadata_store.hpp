#pragma once
#include <sqlite_modern_cpp.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/db/database_manager.hpp"
#include "sift_core/errors.hpp"
#include "sift_core/types/chunk.hpp"
#include "sift_core/types/document.hpp"
#include "sift_core/types/search.hpp"

namespace sift_core {

class MetadataStoreError : public StorageError {
 public:
  explicit MetadataStoreError(const std::string &message) : StorageError(message) {}
};

struct ChunkWrite {
  Chunk chunk;
  std::vector<float> embedding;
};

struct VersionWrite {
  std::string knowledge_base = DEFAULT_KNOWLEDGE_BASE;
  std::string origin;
  std::string content_hash;
  DocumentClass doc_class = DocumentClass::Mixed;
  std::vector<ChunkWrite> chunks;
};

struct VersionWriteResult {
  bool unchanged = false;
  int64_t document_id = 0;
  int version = 0;
  std::chrono::system_clock::time_point created_at;
  std::vector<int64_t> chunk_ids;  // parallel to VersionWrite::chunks
  std::vector<int64_t> superseded_chunk_ids;
};

struct EmbeddingRow {
  int64_t chunk_id = 0;
  int64_t document_id = 0;
  int version = 0;
  std::string knowledge_base;
  DocumentClass doc_class = DocumentClass::Text;
  std::string language;
  std::chrono::system_clock::time_point created_at;
  std::vector<float> vector;
};

struct LexicalHit {
  int64_t chunk_id;
  double score;  // negated bm25, higher is better
};

enum class Adjacency { Previous, Next };

class MetadataStore {
 public:
  explicit MetadataStore(DatabaseManager &db_manager);

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;
  MetadataStore(MetadataStore &&) = delete;
  MetadataStore &operator=(MetadataStore &&) = delete;

  /*
  Writes a new DocumentVersion with its chunks, lexical rows and embedding rows, and soft-deletes
  every live chunk of older versions, all in one IMMEDIATE transaction. before_commit runs after
  every row is written and before COMMIT; an exception from it rolls everything back.

  If the document's current version already carries the content hash nothing is written and the
  result is marked unchanged.
  */
  VersionWriteResult write_version(
      const VersionWrite &write,
      const std::function<void(const VersionWriteResult &)> &before_commit = {});

  std::optional<DocumentRecord> get_document(int64_t document_id);
  std::optional<DocumentRecord> get_document_by_origin(const std::string &knowledge_base,
                                                       const std::string &origin);
  std::vector<DocumentRecord> list_documents(
      const std::optional<std::string> &knowledge_base = std::nullopt);
  std::vector<DocumentVersionRecord> list_versions(int64_t document_id);
  std::vector<int64_t> find_documents_by_origin_prefix(const std::string &knowledge_base,
                                                       const std::string &prefix);

  std::vector<StoredChunk> list_chunks(int64_t document_id,
                                       std::optional<int> version = std::nullopt,
                                       bool include_deleted = false);
  // Returned in the order of chunk_ids; unknown (or deleted, unless requested) ids are skipped.
  std::vector<StoredChunk> get_chunks(const std::vector<int64_t> &chunk_ids,
                                      bool include_deleted = false);
  std::optional<StoredChunk> get_adjacent_chunk(const StoredChunk &chunk, Adjacency direction);

  // BM25 ranked search over live chunks matching the filters.
  std::vector<LexicalHit> lexical_search(const std::string &query,
                                         size_t limit,
                                         const SearchFilters &filters);

  // Embeddings of live chunks, for rebuilding the vector index.
  std::vector<EmbeddingRow> load_live_embeddings();

  // Removes a document with its versions, chunks, lexical rows and embeddings.
  // Returns the removed chunk ids. Throws NotFoundError for unknown ids. before_commit gets the
  // chunk ids inside the IMMEDIATE transaction, like write_version's.
  std::vector<int64_t> delete_document(
      int64_t document_id,
      const std::function<void(const std::vector<int64_t> &)> &before_commit = {});

  // Physically removes chunks soft-deleted before the cutoff. Returns their ids.
  std::vector<int64_t> purge_deleted_chunks(
      std::chrono::system_clock::time_point deleted_before,
      const std::function<void(const std::vector<int64_t> &)> &before_commit = {});

  std::optional<int> get_index_dimensions();
  void set_index_dimensions(int dimensions);

  // FTS5 expression matching any query term; empty when the query has no terms.
  static std::string build_match_expression(const std::string &query);

 private:
  DatabaseManager &db_manager_;

  void delete_lexical_rows(sqlite::database &db, const std::vector<int64_t> &chunk_ids);
  static std::string int_vector_to_comma_string(const std::vector<int64_t> &vector);
};
}  // namespace sift_core
