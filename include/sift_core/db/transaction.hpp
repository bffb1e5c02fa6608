#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

#include "sift_core/db/sqlite_error_utils.hpp"

namespace sift_core {

enum class TransactionMode {
  Deferred,
  // Takes the database write lock at BEGIN. Writers that also take the storage switch lock do so
  // only after this, from inside the transaction.
  Immediate
};

// Rolls back unless commit() was reached.
class Transaction {
 public:
  Transaction(sqlite::database &db, TransactionMode mode) : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    open_ = true;
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    db_ << "COMMIT;";
    open_ = false;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      // A failed COMMIT or statement may already have ended the transaction
      std::cerr << "Warning: " << format_db_error("rollback", e) << std::endl;
    }
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace sift_core
