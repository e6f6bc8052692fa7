#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace docsearch_core {

// Coarse classes of SQLite failure surfaced in StoreError messages.
enum class DbErrorKind { Busy, Constraint, Storage, Other };

inline DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::Busy;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return DbErrorKind::Storage;
    default:
      return DbErrorKind::Other;
  }
}

inline const char *kind_label(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Busy:
      return "database busy";
    case DbErrorKind::Constraint:
      return "constraint violated";
    case DbErrorKind::Storage:
      return "storage unavailable";
    default:
      return "sqlite error";
  }
}

// e.g. "insert in collection 'manuals' failed (constraint violated): UNIQUE ... [sqlite 19/2067]"
inline std::string format_db_error(const std::string &operation,
                                   const std::string &collection,
                                   const sqlite::sqlite_exception &e) {
  return operation + " in collection '" + collection + "' failed (" +
         kind_label(classify_sqlite_code(e.get_code())) + "): " + e.errstr() + " [sqlite " +
         std::to_string(e.get_code()) + "/" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace docsearch_core
