#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

#include "docsearch_core/db/database_manager.hpp"

namespace docsearch_core {

// Scoped lease on one pooled SQLite connection; blocks while the pool is
// empty and throws once the manager has shut down.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), conn_(manager.get_connection()) {}

  ~PooledConnection() {
    manager_.return_connection(std::move(conn_));
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

  sqlite::database &operator*() const {
    return *conn_;
  }
  sqlite::database *operator->() const {
    return conn_.get();
  }

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace docsearch_core
