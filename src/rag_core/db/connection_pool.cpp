#include "rag_core/db/connection_pool.hpp"

#include <stdexcept>
#include <utility>

namespace rag_core {

ConnectionPool::ConnectionPool(std::string db_path, int max_size, int busy_timeout_ms)
    : db_path_(std::move(db_path)), max_size_(max_size), busy_timeout_ms_(busy_timeout_ms) {
  if (max_size_ <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA synchronous = NORMAL;";
  *db << "PRAGMA busy_timeout = " + std::to_string(busy_timeout_ms_) + ";";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::acquire(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool available = released_.wait_for(lock, wait, [this] {
    return closed_ || !idle_.empty() || opened_ < max_size_;
  });
  if (closed_) {
    throw ConnectionPoolError("Connection pool for " + db_path_ + " is closed");
  }
  if (!available) {
    throw ConnectionPoolError("Timed out after " + std::to_string(wait.count()) +
                              "ms waiting for a database connection");
  }

  if (!idle_.empty()) {
    std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
    idle_.pop_back();
    return conn;
  }
  // Reserve the slot before opening so the lock is not held during file I/O.
  ++opened_;
  lock.unlock();
  try {
    return open_connection();
  } catch (...) {
    std::lock_guard<std::mutex> relock(mutex_);
    --opened_;
    released_.notify_one();
    throw;
  }
}

void ConnectionPool::release(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || !conn) {
    --opened_;
  } else {
    idle_.push_back(std::move(conn));
  }
  released_.notify_one();
}

void ConnectionPool::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  opened_ -= static_cast<int>(idle_.size());
  idle_.clear();
  released_.notify_all();
}

size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

int ConnectionPool::opened_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return opened_;
}

}  // namespace rag_core
