#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace sift_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Schema, Generic };

struct DbErrorInfo {
  DbErrorKind kind;
  const char *name;
  // Another writer held the lock past busy_timeout; the same call may succeed later
  bool retryable;
};

inline DbErrorInfo describe_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return {DbErrorKind::BusyOrLocked, "busy_or_locked", true};
    case SQLITE_CONSTRAINT:
      return {DbErrorKind::Constraint, "constraint", false};
    case SQLITE_READONLY:
      return {DbErrorKind::Readonly, "readonly", false};
    case SQLITE_IOERR:
      return {DbErrorKind::Io, "io", false};
    case SQLITE_CANTOPEN:
      return {DbErrorKind::CantOpen, "cantopen", false};
    case SQLITE_FULL:
      return {DbErrorKind::Full, "full", false};
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return {DbErrorKind::Schema, "schema", false};
    default:
      return {DbErrorKind::Generic, "generic", false};
  }
}

inline bool is_retryable(const sqlite::sqlite_exception &e) {
  return describe_sqlite_code(e.get_code()).retryable;
}

// "<operation> failed: (<kind>[, retryable]) <sqlite message> in "<sql>" [code=.., xcode=..]"
inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  const DbErrorInfo info = describe_sqlite_code(e.get_code());
  std::string msg = operation + " failed: (" + info.name + (info.retryable ? ", retryable" : "") +
                    ") " + e.what();
  if (!e.get_sql().empty()) {
    msg += " in \"" + e.get_sql() + "\"";
  }
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return msg;
}

}  // namespace sift_core
