#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "lens_core/errors.hpp"

namespace lens_core {

enum class DbErrorKind { BusyOrLocked, Io, Constraint, Full, Corrupt, NotADatabase, Other };

// Accepts primary or extended result codes.
inline DbErrorKind classify_sqlite_code(int code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_CORRUPT:
      return DbErrorKind::Corrupt;
    case SQLITE_NOTADB:
      return DbErrorKind::NotADatabase;
    default:
      return DbErrorKind::Other;
  }
}

inline const char *to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
      return "busy";
    case DbErrorKind::Io:
      return "io";
    case DbErrorKind::Constraint:
      return "constraint";
    case DbErrorKind::Full:
      return "full";
    case DbErrorKind::Corrupt:
      return "corrupt";
    case DbErrorKind::NotADatabase:
      return "not_a_database";
    default:
      return "other";
  }
}

// Busy/locked and I/O hiccups are worth retrying, constraint violations are the caller's fault.
inline FailureKind failure_kind_for(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
    case DbErrorKind::Io:
      return FailureKind::Transient;
    case DbErrorKind::Constraint:
      return FailureKind::InvalidInput;
    default:
      return FailureKind::Fatal;
  }
}

// "<operation> failed (<kind>): <sqlite message> [code=N]"
inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  return operation + " failed (" + to_string(classify_sqlite_code(e.get_code())) +
         "): " + e.errstr() + " [code=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace lens_core
