#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>
#include <stdexcept>

#include "lens_core/db/database_manager.hpp"

namespace lens_core {

// Borrows a connection from a DatabaseManager for the lifetime of the guard.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(&manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw std::runtime_error("No database connection available: the pool is shutting down");
    }
  }

  PooledConnection(PooledConnection &&other) noexcept
      : manager_(other.manager_), conn_(std::move(other.conn_)) {}

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;
  PooledConnection &operator=(PooledConnection &&) = delete;

  ~PooledConnection() {
    if (conn_) {
      manager_->return_connection(std::move(conn_));
    }
  }

  sqlite::database &operator*() const {
    return *conn_;
  }

  sqlite::database *operator->() const {
    return conn_.get();
  }

 private:
  DatabaseManager *manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace lens_core
