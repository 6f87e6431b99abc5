#include "margin_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

namespace margin_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    if (db_path != db_path_) {
      std::cerr << "[Database] Warning: metadata database already open at " << db_path_ << ", ignoring " << db_path
                << std::endl;
    }
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, then the pool that the services share
  setup_schema(db_path);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  db_path_ = db_path;
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  db_path_.clear();
  is_initialized_ = false;
}

size_t DatabaseManager::available_connections() {
  return is_initialized_ ? pool_->available() : 0;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // Single-use connection so table creation never races the pool
  sqlite::database db(db_path.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS notebooks (
          id TEXT PRIMARY KEY,
          title TEXT NOT NULL,
          created_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS sources (
          id TEXT PRIMARY KEY,
          notebook_id TEXT NOT NULL,
          title TEXT NOT NULL,
          content TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          created_at TEXT NOT NULL,
          FOREIGN KEY (notebook_id) REFERENCES notebooks(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id TEXT PRIMARY KEY,
          source_id TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          text TEXT NOT NULL,
          token_count INTEGER NOT NULL,
          page_number INTEGER,
          FOREIGN KEY (source_id) REFERENCES sources(id) ON DELETE CASCADE
      )
    )";

  db << "CREATE INDEX IF NOT EXISTS idx_sources_notebook ON sources(notebook_id)";
  db << "CREATE INDEX IF NOT EXISTS idx_chunks_source ON chunks(source_id, chunk_index)";
}

}  // namespace margin_core
