#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "lens_core/db/connection_pool.hpp"

#include <stdexcept>

namespace lens_core {

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(const std::string &db_path,
                                                                  const std::string &db_key) {
  auto db = std::make_unique<sqlite::database>(db_path);
  sqlite3 *handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Failed to get native handle for " + db_path);
  }

  // An empty key leaves the database in plaintext
  if (!db_key.empty() &&
      sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.size())) != SQLITE_OK) {
    throw std::runtime_error("Failed to key database " + db_path + ": " + sqlite3_errmsg(handle));
  }

  // First read fails here when the key is wrong
  *db << "SELECT count(*) FROM sqlite_master;";

  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

ConnectionPool::ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool needs at least one connection");
  }
  for (int i = 0; i < pool_size; ++i) {
    idle_.push(open_connection(db_path_, db_key_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_.wait(lock, [this] { return shutting_down_ || !idle_.empty(); });
  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  auto conn = std::move(idle_.front());
  idle_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_ || !conn) {
      return;
    }
    idle_.push(std::move(conn));
  }
  available_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(idle_);
  }
  available_.notify_all();
}

size_t ConnectionPool::idle_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace lens_core
