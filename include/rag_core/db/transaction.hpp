#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace rag_core {

enum class TxMode { Deferred, Immediate };

// Scoped BEGIN/COMMIT. Anything not committed is rolled back when the scope
// ends. Immediate mode takes the write lock at BEGIN, which the queue claim and
// the chunk compare-and-set need so their read and write see the same state.
class Transaction {
 public:
  Transaction(sqlite::database& db, TxMode mode) : db_(db) {
    db_ << (mode == TxMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }
  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "ROLLBACK failed (code " << e.get_code() << "): " << e.what() << std::endl;
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace rag_core
