#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

namespace margin_core {

// Coarse classes of SQLite failures that callers react to differently.
enum class DbErrorKind { Busy, Constraint, Storage, Schema, Generic };

inline DbErrorKind classify_sqlite_error(const sqlite::sqlite_exception& e) {
  switch (e.get_code()) {
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
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline const char* to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Busy: return "busy";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Storage: return "storage";
    case DbErrorKind::Schema: return "schema";
    default: return "generic";
  }
}

// Foreign key violations carry the extended code SQLITE_CONSTRAINT_FOREIGNKEY
inline bool is_foreign_key_violation(const sqlite::sqlite_exception& e) {
  return e.get_extended_code() == SQLITE_CONSTRAINT_FOREIGNKEY;
}

// "<operation> failed: (<kind>) <sqlite message> [xcode=N]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  return operation + " failed: (" + to_string(classify_sqlite_error(e)) + ") " + e.errstr() +
         " [xcode=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace margin_core
