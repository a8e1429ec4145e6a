#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "rag_core/db/connection_pool.hpp"

namespace rag_core {

// Owns the sqlite file holding datasets, documents, ingestion tasks and the
// rows of FaissStore databases. Created once by the server and passed by
// reference to whatever needs a connection.
class DatabaseManager {
 public:
  static constexpr int DEFAULT_POOL_SIZE = 4;
  static constexpr int BUSY_TIMEOUT_MS = 5000;
  static constexpr std::chrono::milliseconds ACQUIRE_TIMEOUT{30000};

  explicit DatabaseManager(const std::filesystem::path& db_path,
                           int pool_size = DEFAULT_POOL_SIZE);
  ~DatabaseManager();

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> acquire();
  void release(std::unique_ptr<sqlite::database> conn);

  const ConnectionPool& pool() const {
    return *pool_;
  }

  void shutdown();

  const std::filesystem::path& db_path() const {
    return db_path_;
  }

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_shut_down_ = false;
};

}  // namespace rag_core
