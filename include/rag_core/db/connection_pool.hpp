#pragma once
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace rag_core {

// No connection could be handed out: the pool is closed or the wait timed out.
class ConnectionPoolError : public std::runtime_error {
 public:
  explicit ConnectionPoolError(const std::string& message) : std::runtime_error(message) {}
};

// Up to max_size sqlite connections, opened on first demand and reused after
// that. HTTP handlers, workers and per-file ingestion threads all draw from it.
class ConnectionPool {
 public:
  ConnectionPool(std::string db_path, int max_size, int busy_timeout_ms);

  // Waits at most `wait` for a free connection, then throws ConnectionPoolError.
  // Also throws once close() has run.
  std::unique_ptr<sqlite::database> acquire(std::chrono::milliseconds wait);
  void release(std::unique_ptr<sqlite::database> conn);

  // Drops idle connections and fails every pending and future acquire.
  void close();

  size_t idle_count() const;
  int opened_count() const;

 private:
  std::unique_ptr<sqlite::database> open_connection() const;

  const std::string db_path_;
  const int max_size_;
  const int busy_timeout_ms_;

  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::vector<std::unique_ptr<sqlite::database>> idle_;
  int opened_ = 0;
  bool closed_ = false;
};

}  // namespace rag_core
