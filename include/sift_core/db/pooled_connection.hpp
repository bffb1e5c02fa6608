#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

#include "sift_core/db/database_manager.hpp"

namespace sift_core {

// Borrows one connection for the guard's lifetime. Construction throws StorageError when the pool
// is shut down or stays exhausted past its acquire timeout.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), conn_(manager.get_connection()) {}

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

  sqlite::database *operator->() const {
    return conn_.get();
  }
  sqlite::database &operator*() const {
    return *conn_;
  }

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace sift_core
