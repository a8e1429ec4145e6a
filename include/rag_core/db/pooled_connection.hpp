#pragma once
#include <sqlite_modern_cpp.h>

#include <memory>

#include "rag_core/db/database_manager.hpp"

namespace rag_core {

// Scoped lease on one pooled connection; returned to the pool on destruction.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(&manager), conn_(manager.acquire()) {}
  ~PooledConnection() {
    if (conn_) {
      manager_->release(std::move(conn_));
    }
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& operator*() const {
    return *conn_;
  }
  sqlite::database* operator->() const {
    return conn_.get();
  }

 private:
  DatabaseManager* manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace rag_core
