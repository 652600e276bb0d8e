#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace lens_core {

/**
 * @brief Fixed-size pool of keyed SQLCipher connections.
 *
 * Every connection is opened and keyed up front, so a wrong key fails at
 * construction time. Borrowers block while the pool is empty.
 */
class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size);

  // Blocks until a connection is free. Throws once the pool is shut down.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);

  // Drops idle connections and wakes every waiting borrower.
  void shutdown();

  size_t idle_count();

  // Opens and keys a single connection with the pool's pragmas applied.
  static std::unique_ptr<sqlite::database> open_connection(const std::string &db_path,
                                                           const std::string &db_key);

 private:
  std::string db_path_;
  std::string db_key_;
  std::queue<std::unique_ptr<sqlite::database>> idle_;
  std::mutex mutex_;
  std::condition_variable available_;
  bool shutting_down_ = false;
};

}  // namespace lens_core
