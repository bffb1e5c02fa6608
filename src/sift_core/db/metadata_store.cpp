#include "sift_core/db/metadata_store.hpp"

#include <cctype>
#include <cstring>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "sift_core/db/pooled_connection.hpp"
#include "sift_core/db/sqlite_error_utils.hpp"
#include "sift_core/db/time_utils.hpp"
#include "sift_core/db/transaction.hpp"
#include "sift_core/services/compression_service.hpp"

namespace sift_core {

namespace {

constexpr const char *INDEX_DIMENSIONS_KEY = "embedding_dimensions";

constexpr const char *CHUNK_SELECT =
    "SELECT c.id, c.document_id, c.version, c.chunk_index, d.origin, c.content, "
    "c.start_offset, c.end_offset, c.token_count, c.doc_class, c.language, c.attributes, "
    "c.is_deleted, c.created_at FROM chunks c JOIN documents d ON d.id = c.document_id ";

constexpr const char *DOCUMENT_SELECT =
    "SELECT id, origin, knowledge_base, content_hash, doc_class, current_version, created_at, "
    "updated_at FROM documents ";

// Row callback matching CHUNK_SELECT.
auto chunk_reader(std::vector<StoredChunk> &out) {
  return [&out](long long id, long long document_id, int version, int chunk_index,
                std::string origin, std::vector<char> content, long long start_offset,
                long long end_offset, int token_count, std::string doc_class, std::string language,
                std::string attributes, int is_deleted, std::string created_at) {
    StoredChunk chunk;
    chunk.id = id;
    chunk.document_id = document_id;
    chunk.version = version;
    chunk.chunk_index = chunk_index;
    chunk.origin = std::move(origin);
    chunk.content = CompressionService::decompress(content);
    chunk.start_offset = static_cast<size_t>(start_offset);
    chunk.end_offset = static_cast<size_t>(end_offset);
    chunk.token_count = token_count;
    chunk.doc_class = document_class_from_string(doc_class);
    chunk.language = std::move(language);
    chunk.attributes = attributes_from_json(attributes);
    chunk.is_deleted = is_deleted != 0;
    chunk.created_at = string_to_time_point(created_at);
    out.push_back(std::move(chunk));
  };
}

// Row callback matching DOCUMENT_SELECT.
auto document_reader(std::vector<DocumentRecord> &out) {
  return [&out](long long id, std::string origin, std::string knowledge_base,
                std::string content_hash, std::string doc_class, int current_version,
                std::string created_at, std::string updated_at) {
    DocumentRecord doc;
    doc.id = id;
    doc.origin = std::move(origin);
    doc.knowledge_base = std::move(knowledge_base);
    doc.content_hash = std::move(content_hash);
    doc.doc_class = document_class_from_string(doc_class);
    doc.current_version = current_version;
    doc.created_at = string_to_time_point(created_at);
    doc.updated_at = string_to_time_point(updated_at);
    out.push_back(std::move(doc));
  };
}

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  return vector;
}

bool is_term_byte(unsigned char c) {
  return c >= 0x80 || std::isalnum(c);
}

}  // namespace

MetadataStore::MetadataStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

VersionWriteResult MetadataStore::write_version(
    const VersionWrite &write,
    const std::function<void(const VersionWriteResult &)> &before_commit) {
  if (write.origin.empty()) {
    throw ValidationError("Document origin must not be empty");
  }
  if (write.chunks.empty()) {
    throw ValidationError("A document version needs at least one chunk");
  }

  // Compress outside the transaction to keep the write lock short
  std::vector<std::vector<char>> compressed;
  compressed.reserve(write.chunks.size());
  for (const auto &item : write.chunks) {
    compressed.push_back(CompressionService::compress(item.chunk.content));
  }

  try {
    VersionWriteResult result;
    const std::string now_str = time_point_to_string(std::chrono::system_clock::now());
    result.created_at = string_to_time_point(now_str);

    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    long long document_id = -1;
    std::string current_hash;
    int current_version = 0;
    *conn << "SELECT id, content_hash, current_version FROM documents "
             "WHERE knowledge_base = ? AND origin = ?"
          << write.knowledge_base << write.origin >>
        [&](long long id, std::string hash, int version) {
          document_id = id;
          current_hash = std::move(hash);
          current_version = version;
        };

    if (document_id != -1 && current_version > 0 && current_hash == write.content_hash) {
      result.unchanged = true;
      result.document_id = document_id;
      result.version = current_version;
      tx.commit();
      return result;
    }

    if (document_id == -1) {
      *conn << "INSERT INTO documents (knowledge_base, origin, content_hash, doc_class, "
               "current_version, created_at, updated_at) VALUES (?,?,?,?,0,?,?)"
            << write.knowledge_base << write.origin << write.content_hash
            << to_string(write.doc_class) << now_str << now_str;
      document_id = conn->last_insert_rowid();
    }
    result.document_id = document_id;

    int next_version = 1;
    *conn << "SELECT COALESCE(MAX(version), 0) + 1 FROM document_versions WHERE document_id = ?"
          << document_id >>
        next_version;
    result.version = next_version;

    *conn << "INSERT INTO document_versions (document_id, version, content_hash, created_at) "
             "VALUES (?,?,?,?)"
          << document_id << next_version << write.content_hash << now_str;

    // Everything live right now belongs to older versions
    *conn << "SELECT id FROM chunks WHERE document_id = ? AND is_deleted = 0 ORDER BY id"
          << document_id >>
        [&](long long id) { result.superseded_chunk_ids.push_back(id); };
    *conn << "UPDATE chunks SET is_deleted = 1, deleted_at = ? WHERE document_id = ? AND "
             "is_deleted = 0"
          << now_str << document_id;
    *conn << "UPDATE chunk_embeddings SET is_deleted = 1 WHERE document_id = ? AND is_deleted = 0"
          << document_id;

    result.chunk_ids.reserve(write.chunks.size());
    for (size_t i = 0; i < write.chunks.size(); ++i) {
      const Chunk &chunk = write.chunks[i].chunk;
      *conn << "INSERT INTO chunks (document_id, version, chunk_index, content, start_offset, "
               "end_offset, token_count, doc_class, language, attributes, created_at) "
               "VALUES (?,?,?,?,?,?,?,?,?,?,?)"
            << document_id << next_version << chunk.chunk_index << compressed[i]
            << static_cast<long long>(chunk.start_offset)
            << static_cast<long long>(chunk.end_offset) << chunk.token_count
            << to_string(chunk.doc_class) << chunk.language
            << attributes_to_json(chunk.attributes) << now_str;
      long long chunk_id = conn->last_insert_rowid();
      result.chunk_ids.push_back(chunk_id);

      *conn << "INSERT INTO chunks_fts (rowid, content) VALUES (?, ?)" << chunk_id
            << chunk.content;

      const auto &embedding = write.chunks[i].embedding;
      if (!embedding.empty()) {
        *conn << "INSERT INTO chunk_embeddings (chunk_id, document_id, version, knowledge_base, "
                 "doc_class, language, created_at, dimensions, vector) VALUES (?,?,?,?,?,?,?,?,?)"
              << chunk_id << document_id << next_version << write.knowledge_base
              << to_string(chunk.doc_class) << chunk.language << now_str
              << static_cast<int>(embedding.size()) << vector_to_blob(embedding);
      }
    }

    *conn << "UPDATE documents SET content_hash = ?, doc_class = ?, current_version = ?, "
             "updated_at = ? WHERE id = ?"
          << write.content_hash << to_string(write.doc_class) << next_version << now_str
          << document_id;

    if (before_commit) {
      before_commit(result);
    }
    tx.commit();
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("write_version", e));
  }
}

std::optional<DocumentRecord> MetadataStore::get_document(int64_t document_id) {
  try {
    std::vector<DocumentRecord> docs;
    PooledConnection conn(db_manager_);
    *conn << std::string(DOCUMENT_SELECT) + "WHERE id = ?"
          << static_cast<long long>(document_id) >>
        document_reader(docs);
    if (docs.empty()) {
      return std::nullopt;
    }
    return docs.front();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_document", e));
  }
}

std::optional<DocumentRecord> MetadataStore::get_document_by_origin(
    const std::string &knowledge_base, const std::string &origin) {
  try {
    std::vector<DocumentRecord> docs;
    PooledConnection conn(db_manager_);
    *conn << std::string(DOCUMENT_SELECT) + "WHERE knowledge_base = ? AND origin = ?"
          << knowledge_base << origin >>
        document_reader(docs);
    if (docs.empty()) {
      return std::nullopt;
    }
    return docs.front();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_document_by_origin", e));
  }
}

std::vector<DocumentRecord> MetadataStore::list_documents(
    const std::optional<std::string> &knowledge_base) {
  try {
    std::vector<DocumentRecord> docs;
    PooledConnection conn(db_manager_);
    if (knowledge_base) {
      *conn << std::string(DOCUMENT_SELECT) + "WHERE knowledge_base = ? ORDER BY id"
            << *knowledge_base >>
          document_reader(docs);
    } else {
      *conn << std::string(DOCUMENT_SELECT) + "ORDER BY id" >> document_reader(docs);
    }
    return docs;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("list_documents", e));
  }
}

std::vector<DocumentVersionRecord> MetadataStore::list_versions(int64_t document_id) {
  try {
    std::vector<DocumentVersionRecord> versions;
    PooledConnection conn(db_manager_);
    *conn << "SELECT document_id, version, content_hash, created_at FROM document_versions "
             "WHERE document_id = ? ORDER BY version"
          << static_cast<long long>(document_id) >>
        [&](long long doc_id, int version, std::string hash, std::string created_at) {
          DocumentVersionRecord record;
          record.document_id = doc_id;
          record.version = version;
          record.content_hash = std::move(hash);
          record.created_at = string_to_time_point(created_at);
          versions.push_back(std::move(record));
        };
    return versions;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("list_versions", e));
  }
}

std::vector<int64_t> MetadataStore::find_documents_by_origin_prefix(
    const std::string &knowledge_base, const std::string &prefix) {
  try {
    std::vector<int64_t> ids;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM documents WHERE knowledge_base = ? AND "
             "substr(origin, 1, length(?)) = ? ORDER BY id"
          << knowledge_base << prefix << prefix >>
        [&](long long id) { ids.push_back(id); };
    return ids;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("find_documents_by_origin_prefix", e));
  }
}

std::vector<StoredChunk> MetadataStore::list_chunks(int64_t document_id,
                                                    std::optional<int> version,
                                                    bool include_deleted) {
  try {
    std::vector<StoredChunk> chunks;
    PooledConnection conn(db_manager_);
    std::string sql = std::string(CHUNK_SELECT) + "WHERE c.document_id = ?";
    if (version) {
      sql += " AND c.version = " + std::to_string(*version);
    }
    if (!include_deleted) {
      sql += " AND c.is_deleted = 0";
    }
    sql += " ORDER BY c.version, c.chunk_index";
    *conn << sql << static_cast<long long>(document_id) >> chunk_reader(chunks);
    return chunks;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("list_chunks", e));
  }
}

std::vector<StoredChunk> MetadataStore::get_chunks(const std::vector<int64_t> &chunk_ids,
                                                   bool include_deleted) {
  if (chunk_ids.empty()) {
    return {};
  }
  try {
    std::vector<StoredChunk> rows;
    {
      PooledConnection conn(db_manager_);
      std::string sql = std::string(CHUNK_SELECT) + "WHERE c.id IN (" +
                        int_vector_to_comma_string(chunk_ids) + ")";
      if (!include_deleted) {
        sql += " AND c.is_deleted = 0";
      }
      *conn << sql >> chunk_reader(rows);
    }

    std::unordered_map<int64_t, size_t> position;
    for (size_t i = 0; i < rows.size(); ++i) {
      position[rows[i].id] = i;
    }
    std::vector<StoredChunk> ordered;
    ordered.reserve(rows.size());
    for (int64_t id : chunk_ids) {
      auto it = position.find(id);
      if (it != position.end()) {
        ordered.push_back(rows[it->second]);
      }
    }
    return ordered;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_chunks", e));
  }
}

std::optional<StoredChunk> MetadataStore::get_adjacent_chunk(const StoredChunk &chunk,
                                                             Adjacency direction) {
  try {
    std::vector<StoredChunk> rows;
    PooledConnection conn(db_manager_);
    std::string sql = std::string(CHUNK_SELECT) +
                      "WHERE c.document_id = ? AND c.version = ? AND c.is_deleted = 0 AND ";
    if (direction == Adjacency::Previous) {
      sql += "c.chunk_index < ? ORDER BY c.chunk_index DESC LIMIT 1";
    } else {
      sql += "c.chunk_index > ? ORDER BY c.chunk_index ASC LIMIT 1";
    }
    *conn << sql << static_cast<long long>(chunk.document_id) << chunk.version
          << chunk.chunk_index >>
        chunk_reader(rows);
    if (rows.empty()) {
      return std::nullopt;
    }
    return rows.front();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_adjacent_chunk", e));
  }
}

std::vector<LexicalHit> MetadataStore::lexical_search(const std::string &query,
                                                      size_t limit,
                                                      const SearchFilters &filters) {
  std::vector<LexicalHit> hits;
  const std::string match = build_match_expression(query);
  if (match.empty() || limit == 0) {
    return hits;
  }

  // All bound values are text; integer ids are inlined
  std::string sql =
      "SELECT c.id, bm25(chunks_fts) AS rank FROM chunks_fts "
      "JOIN chunks c ON c.id = chunks_fts.rowid "
      "JOIN documents d ON d.id = c.document_id "
      "WHERE chunks_fts MATCH ? AND c.is_deleted = 0";
  std::vector<std::string> params;
  params.push_back(match);

  auto placeholders = [](size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
      out += (i == 0) ? "?" : ",?";
    }
    return out;
  };

  if (!filters.classes.empty()) {
    sql += " AND c.doc_class IN (" + placeholders(filters.classes.size()) + ")";
    for (auto doc_class : filters.classes) {
      params.push_back(to_string(doc_class));
    }
  }
  if (!filters.languages.empty()) {
    sql += " AND c.language IN (" + placeholders(filters.languages.size()) + ")";
    params.insert(params.end(), filters.languages.begin(), filters.languages.end());
  }
  if (!filters.document_ids.empty()) {
    sql += " AND c.document_id IN (" + int_vector_to_comma_string(filters.document_ids) + ")";
  }
  if (filters.created_from) {
    sql += " AND c.created_at >= ?";
    params.push_back(time_point_to_string(*filters.created_from));
  }
  if (filters.created_to) {
    sql += " AND c.created_at <= ?";
    params.push_back(time_point_to_string(*filters.created_to));
  }
  if (filters.knowledge_base) {
    sql += " AND d.knowledge_base = ?";
    params.push_back(*filters.knowledge_base);
  }
  sql += " ORDER BY rank ASC, c.id ASC LIMIT " + std::to_string(limit);

  try {
    PooledConnection conn(db_manager_);
    auto stmt = (*conn << sql);
    for (const auto &param : params) {
      stmt << param;
    }
    stmt >> [&](long long id, double rank) { hits.push_back({id, -rank}); };
    return hits;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("lexical_search", e));
  }
}

std::vector<EmbeddingRow> MetadataStore::load_live_embeddings() {
  try {
    std::vector<EmbeddingRow> rows;
    PooledConnection conn(db_manager_);
    *conn << "SELECT chunk_id, document_id, version, knowledge_base, doc_class, language, "
             "created_at, vector FROM chunk_embeddings WHERE is_deleted = 0 ORDER BY chunk_id" >>
        [&](long long chunk_id, long long document_id, int version, std::string knowledge_base,
            std::string doc_class, std::string language, std::string created_at,
            std::vector<char> vector_blob) {
          EmbeddingRow row;
          row.chunk_id = chunk_id;
          row.document_id = document_id;
          row.version = version;
          row.knowledge_base = std::move(knowledge_base);
          row.doc_class = document_class_from_string(doc_class);
          row.language = std::move(language);
          row.created_at = string_to_time_point(created_at);
          row.vector = blob_to_vector(vector_blob);
          rows.push_back(std::move(row));
        };
    return rows;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("load_live_embeddings", e));
  }
}

std::vector<int64_t> MetadataStore::delete_document(
    int64_t document_id,
    const std::function<void(const std::vector<int64_t> &)> &before_commit) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    bool exists = false;
    *conn << "SELECT 1 FROM documents WHERE id = ? LIMIT 1" << static_cast<long long>(document_id) >>
        [&](int /*dummy*/) { exists = true; };
    if (!exists) {
      throw NotFoundError("Document with ID " + std::to_string(document_id) + " not found");
    }

    // Soft-deleted chunks still own lexical rows until they are purged
    std::vector<int64_t> chunk_ids;
    *conn << "SELECT id FROM chunks WHERE document_id = ? ORDER BY id"
          << static_cast<long long>(document_id) >>
        [&](long long id) { chunk_ids.push_back(id); };
    delete_lexical_rows(*conn, chunk_ids);

    // Versions, chunks and embeddings cascade; jobs keep their history with a NULL document
    *conn << "DELETE FROM documents WHERE id = ?" << static_cast<long long>(document_id);
    if (before_commit) {
      before_commit(chunk_ids);
    }
    tx.commit();
    return chunk_ids;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("delete_document", e));
  }
}

std::vector<int64_t> MetadataStore::purge_deleted_chunks(
    std::chrono::system_clock::time_point deleted_before,
    const std::function<void(const std::vector<int64_t> &)> &before_commit) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    std::vector<int64_t> chunk_ids;
    *conn << "SELECT id FROM chunks WHERE is_deleted = 1 AND deleted_at < ? ORDER BY id"
          << time_point_to_string(deleted_before) >>
        [&](long long id) { chunk_ids.push_back(id); };
    if (chunk_ids.empty()) {
      tx.commit();
      return chunk_ids;
    }

    delete_lexical_rows(*conn, chunk_ids);
    *conn << "DELETE FROM chunks WHERE id IN (" + int_vector_to_comma_string(chunk_ids) + ")";
    if (before_commit) {
      before_commit(chunk_ids);
    }
    tx.commit();
    return chunk_ids;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("purge_deleted_chunks", e));
  }
}

std::optional<int> MetadataStore::get_index_dimensions() {
  try {
    std::optional<int> dimensions;
    PooledConnection conn(db_manager_);
    *conn << "SELECT value FROM index_meta WHERE key = ?" << INDEX_DIMENSIONS_KEY >>
        [&](std::string value) { dimensions = std::stoi(value); };
    return dimensions;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_index_dimensions", e));
  }
}

void MetadataStore::set_index_dimensions(int dimensions) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR REPLACE INTO index_meta (key, value) VALUES (?, ?)"
          << INDEX_DIMENSIONS_KEY << std::to_string(dimensions);
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("set_index_dimensions", e));
  }
}

std::string MetadataStore::build_match_expression(const std::string &query) {
  std::vector<std::string> terms;
  std::unordered_set<std::string> seen;
  std::string current;

  auto flush = [&]() {
    if (current.empty()) {
      return;
    }
    std::string folded = current;
    for (auto &c : folded) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (seen.insert(folded).second) {
      terms.push_back(current);
    }
    current.clear();
  };

  for (char c : query) {
    if (is_term_byte(static_cast<unsigned char>(c))) {
      current.push_back(c);
    } else {
      flush();
    }
  }
  flush();

  std::string expression;
  for (size_t i = 0; i < terms.size(); ++i) {
    if (i > 0) {
      expression += " OR ";
    }
    expression += "\"" + terms[i] + "\"";
  }
  return expression;
}

// Contentless FTS5 tables need the original text to remove a row.
void MetadataStore::delete_lexical_rows(sqlite::database &db,
                                        const std::vector<int64_t> &chunk_ids) {
  if (chunk_ids.empty()) {
    return;
  }
  std::vector<std::pair<long long, std::string>> rows;
  db << "SELECT id, content FROM chunks WHERE id IN (" + int_vector_to_comma_string(chunk_ids) +
            ")" >>
      [&](long long id, std::vector<char> content) {
        rows.emplace_back(id, CompressionService::decompress(content));
      };
  for (const auto &[id, content] : rows) {
    db << "INSERT INTO chunks_fts (chunks_fts, rowid, content) VALUES ('delete', ?, ?)" << id
       << content;
  }
}

std::string MetadataStore::int_vector_to_comma_string(const std::vector<int64_t> &vector) {
  std::stringstream ss;
  for (size_t i = 0; i < vector.size(); ++i) {
    ss << vector[i];
    if (i < vector.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace sift_core
