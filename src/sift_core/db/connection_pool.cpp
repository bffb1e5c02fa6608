#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>
#include "sift_core/db/connection_pool.hpp"
#include "sift_core/errors.hpp"

namespace sift_core {

std::unique_ptr<sqlite::database> ConnectionPool::open_keyed(const std::string& db_path,
                                                             const std::string& db_key) {
  auto db = std::make_unique<sqlite::database>(db_path);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw StorageError("Failed to get native database handle for " + db_path);
  }

  if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw StorageError("Failed to key database: " + std::string(sqlite3_errmsg(handle)));
  }

  // A wrong key only surfaces on the first read
  *db << "SELECT count(*) FROM sqlite_master;";

  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

ConnectionPool::ConnectionPool(const std::string& db_path,
                               const std::string& db_key,
                               int pool_size,
                               std::chrono::milliseconds acquire_timeout)
    : acquire_timeout_(acquire_timeout) {
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_keyed(db_path, db_key));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  const bool available =
      cv_.wait_for(lock, acquire_timeout_, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw StorageError("Connection pool is shut down");
  }
  if (!available) {
    throw StorageError("No database connection became free within " +
                       std::to_string(acquire_timeout_.count()) + "ms");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

size_t ConnectionPool::idle() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

}  // namespace sift_core
