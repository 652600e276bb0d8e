#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "lens_core/db/connection_pool.hpp"

namespace lens_core {

/**
 * @brief Owns the schema and the connection pool of one encrypted database file.
 *
 * Constructed once at startup and handed by reference to the stores that need
 * it. The schema (documents, chunks) is created before the pool opens.
 */
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, const std::string &db_key, int pool_size);
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  size_t idle_connections();

  const std::filesystem::path &db_path() const {
    return db_path_;
  }

 private:
  void create_schema(const std::string &db_key);

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  bool open_ = false;
};

}  // namespace lens_core
