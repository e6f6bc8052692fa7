#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace docsearch_core {

// Holds the database write lock (BEGIN IMMEDIATE) for a batch of chunk
// writes. Unless commit() ran, the batch is rolled back on scope exit.
class WriteTransaction {
 public:
  explicit WriteTransaction(sqlite::database &db) : db_(db) {
    db_ << "BEGIN IMMEDIATE;";
    open_ = true;
  }

  WriteTransaction(const WriteTransaction &) = delete;
  WriteTransaction &operator=(const WriteTransaction &) = delete;

  ~WriteTransaction() {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      // The connection closes the transaction itself when it is destroyed
      std::cerr << "Rollback failed: " << e.errstr() << std::endl;
    }
  }

  void commit() {
    db_ << "COMMIT;";
    open_ = false;
  }

  bool is_open() const {
    return open_;
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace docsearch_core
