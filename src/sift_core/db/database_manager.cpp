#include "sift_core/db/database_manager.hpp"

#include "sift_core/errors.hpp"

namespace sift_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size,
                                 std::chrono::milliseconds acquire_timeout) {
  if (is_initialized_) {
    return;
  }
  if (db_key.empty()) {
    throw ConfigurationError("Database key must not be empty");
  }
  if (pool_size <= 0) {
    throw ConfigurationError("Connection pool size must be greater than 0");
  }
  if (acquire_timeout.count() <= 0) {
    throw ConfigurationError("Connection acquire timeout must be positive");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema(db_path, db_key);

  // 2. Create the connection pool for workers and request handlers
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size, acquire_timeout);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw StorageError("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

size_t DatabaseManager::idle_connections() const {
  return is_initialized_ ? pool_->idle() : 0;
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path,
                                   const std::string& db_key) {
  // Use a temporary, single-use connection just for schema setup.
  auto db_ptr = ConnectionPool::open_keyed(db_path.string(), db_key);
  sqlite::database& db = *db_ptr;

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          knowledge_base TEXT NOT NULL DEFAULT 'default',
          origin TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          doc_class TEXT NOT NULL,
          current_version INTEGER NOT NULL DEFAULT 0,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL,
          UNIQUE (knowledge_base, origin)
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS document_versions (
          document_id INTEGER NOT NULL,
          version INTEGER NOT NULL,
          content_hash TEXT NOT NULL,
          created_at TEXT NOT NULL,
          PRIMARY KEY (document_id, version),
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  // content is zstd-compressed
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          document_id INTEGER NOT NULL,
          version INTEGER NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL,
          start_offset INTEGER NOT NULL,
          end_offset INTEGER NOT NULL,
          token_count INTEGER NOT NULL,
          doc_class TEXT NOT NULL,
          language TEXT NOT NULL DEFAULT '',
          attributes TEXT NOT NULL DEFAULT '{}',
          is_deleted INTEGER NOT NULL DEFAULT 0,
          deleted_at TEXT NULL,
          created_at TEXT NOT NULL,
          CHECK (start_offset >= 0 AND start_offset < end_offset AND token_count > 0),
          FOREIGN KEY (document_id, version)
              REFERENCES document_versions(document_id, version) ON DELETE CASCADE
      )
    )";
  db << "CREATE INDEX IF NOT EXISTS idx_chunks_document_version ON chunks(document_id, version)";
  db << "CREATE INDEX IF NOT EXISTS idx_chunks_is_deleted ON chunks(is_deleted)";

  // Denormalized filter fields travel with the vector so the index can filter without a join.
  db << R"(
      CREATE TABLE IF NOT EXISTS chunk_embeddings (
          chunk_id INTEGER PRIMARY KEY,
          document_id INTEGER NOT NULL,
          version INTEGER NOT NULL,
          knowledge_base TEXT NOT NULL,
          doc_class TEXT NOT NULL,
          language TEXT NOT NULL DEFAULT '',
          created_at TEXT NOT NULL,
          is_deleted INTEGER NOT NULL DEFAULT 0,
          dimensions INTEGER NOT NULL,
          vector BLOB NOT NULL,
          FOREIGN KEY (chunk_id) REFERENCES chunks(id) ON DELETE CASCADE
      )
    )";

  // Contentless: rowid is the chunk id, text lives compressed in chunks.content
  db << R"(
      CREATE VIRTUAL TABLE IF NOT EXISTS chunks_fts USING fts5(
          content,
          content='',
          tokenize='unicode61 remove_diacritics 2'
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS ingestion_jobs (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          document_id INTEGER NULL,
          knowledge_base TEXT NOT NULL,
          origin TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          class_hint TEXT NULL,
          payload BLOB NULL,
          status TEXT NOT NULL DEFAULT 'PENDING',
          stage TEXT NOT NULL DEFAULT 'received',
          progress REAL NOT NULL DEFAULT 0.0,
          error_message TEXT NULL,
          cancel_requested INTEGER NOT NULL DEFAULT 0,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL,
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE SET NULL
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_ingestion_jobs_status
      ON ingestion_jobs(status, created_at)
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_ingestion_jobs_document
      ON ingestion_jobs(knowledge_base, origin, status)
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS index_meta (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";
}

}  // namespace sift_core
