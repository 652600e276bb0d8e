#pragma once

#include <sqlite_modern_cpp.h>

namespace lens_core {

enum class TransactionMode { Deferred, Immediate };

// Scoped write batch on one pooled connection. Rolls back unless commit() ran.
class Transaction {
 public:
  explicit Transaction(sqlite::database &db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    open_ = true;
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &) {
      // SQLite already rolled back when the failing statement aborted the transaction
    }
  }

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace lens_core
