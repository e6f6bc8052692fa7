#include "docsearch_core/db/database_manager.hpp"

#include <stdexcept>

namespace docsearch_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema();

  // 2. Create the connection pool for request handlers and the index builder
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);

  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path_.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS collections (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          name TEXT UNIQUE NOT NULL,
          dimension INTEGER,
          created_at TEXT NOT NULL
      )
    )";

  // page/source/file_path stay nullable: readers default them when absent
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          collection_id INTEGER NOT NULL,
          chunk_id TEXT NOT NULL,
          source TEXT,
          file_path TEXT,
          page INTEGER,
          content BLOB NOT NULL,
          vector_blob BLOB NOT NULL,
          UNIQUE (collection_id, chunk_id),
          FOREIGN KEY (collection_id) REFERENCES collections(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_collection
      ON chunks(collection_id, id)
    )";
}

}  // namespace docsearch_core
