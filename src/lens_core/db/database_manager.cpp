#include "lens_core/db/database_manager.hpp"

#include <stdexcept>

namespace lens_core {

namespace {

constexpr const char *kDocumentsTable = R"(
    CREATE TABLE IF NOT EXISTS documents (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        external_id TEXT UNIQUE NOT NULL,
        title TEXT NOT NULL,
        url_slug TEXT,
        content BLOB,
        content_hash TEXT NOT NULL,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
    )
  )";

// content is zstd-compressed text, vector_blob raw float32
constexpr const char *kChunksTable = R"(
    CREATE TABLE IF NOT EXISTS chunks (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        document_id INTEGER NOT NULL,
        chunk_index INTEGER NOT NULL,
        content BLOB NOT NULL,
        heading TEXT,
        token_count INTEGER NOT NULL,
        vector_blob BLOB,
        UNIQUE (document_id, chunk_index),
        FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
    )
  )";

constexpr const char *kChunksIndex = R"(
    CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, chunk_index)
  )";

}  // namespace

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path,
                                 const std::string &db_key,
                                 int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }
  create_schema(db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), db_key, pool_size);
  open_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::create_schema(const std::string &db_key) {
  // Single-use connection, closed before the pool opens its own
  auto db = ConnectionPool::open_connection(db_path_.string(), db_key);
  for (const char *statement : {kDocumentsTable, kChunksTable, kChunksIndex}) {
    *db << statement;
  }
}

void DatabaseManager::shutdown() {
  if (open_) {
    pool_->shutdown();
    open_ = false;
  }
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!open_) {
    throw std::runtime_error("Database " + db_path_.string() + " has been shut down");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (open_) {
    pool_->return_connection(std::move(conn));
  }
}

size_t DatabaseManager::idle_connections() {
  return open_ ? pool_->idle_count() : 0;
}

}  // namespace lens_core
