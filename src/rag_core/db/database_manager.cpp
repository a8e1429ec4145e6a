#include "rag_core/db/database_manager.hpp"

#include <stdexcept>

namespace rag_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // Schema first, on a single non-pooled connection.
  setup_schema();
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size, BUSY_TIMEOUT_MS);
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (is_shut_down_) {
    return;
  }
  pool_->close();
  is_shut_down_ = true;
}

std::unique_ptr<sqlite::database> DatabaseManager::acquire() {
  if (is_shut_down_) {
    throw ConnectionPoolError("Metadata database " + db_path_.string() + " is shut down");
  }
  return pool_->acquire(ACQUIRE_TIMEOUT);
}

void DatabaseManager::release(std::unique_ptr<sqlite::database> conn) {
  pool_->release(std::move(conn));
}

void DatabaseManager::setup_schema() {
  sqlite::database db(db_path_.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS datasets (
          name TEXT PRIMARY KEY,
          data_processing_strategy TEXT NOT NULL,
          database_name TEXT NOT NULL,
          created_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          dataset_name TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          filename TEXT NOT NULL,
          format TEXT NOT NULL,
          byte_size INTEGER NOT NULL,
          stored_path TEXT NOT NULL,
          ingested_at TEXT NOT NULL,
          UNIQUE (dataset_name, content_hash),
          FOREIGN KEY (dataset_name) REFERENCES datasets(name) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS ingestion_tasks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_type TEXT NOT NULL,
          status TEXT NOT NULL DEFAULT 'pending',
          priority INTEGER NOT NULL DEFAULT 10,
          dataset_name TEXT NOT NULL,
          payload TEXT,
          cancel_requested INTEGER NOT NULL DEFAULT 0,
          error_message TEXT,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_ingestion_tasks_status_priority
      ON ingestion_tasks(status, priority, created_at)
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS task_file_outcomes (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_id INTEGER NOT NULL,
          filename TEXT NOT NULL,
          content_hash TEXT,
          outcome TEXT NOT NULL,
          detail TEXT,
          chunk_count INTEGER NOT NULL DEFAULT 0,
          failed_chunks INTEGER NOT NULL DEFAULT 0,
          extraction_failures INTEGER NOT NULL DEFAULT 0,
          FOREIGN KEY (task_id) REFERENCES ingestion_tasks(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS task_progress (
          task_id INTEGER PRIMARY KEY,
          progress_percent REAL NOT NULL DEFAULT 0.0,
          status_message TEXT NOT NULL DEFAULT 'Initializing...',
          updated_at INTEGER NOT NULL,
          FOREIGN KEY (task_id) REFERENCES ingestion_tasks(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS vector_chunks (
          faiss_id INTEGER PRIMARY KEY AUTOINCREMENT,
          database_name TEXT NOT NULL,
          chunk_id TEXT NOT NULL,
          document_hash TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          chunk_hash TEXT NOT NULL,
          content BLOB NOT NULL,
          metadata TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          UNIQUE (database_name, chunk_id)
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_vector_chunks_document
      ON vector_chunks(database_name, document_hash)
    )";
}

}  // namespace rag_core
