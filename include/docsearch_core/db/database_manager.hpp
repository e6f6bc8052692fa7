#pragma once

#include "docsearch_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docsearch_core {

// Owns the schema and the connection pool for the vector database file.
// Constructed once in main and handed to the stores by reference.
class DatabaseManager {
public:
    DatabaseManager(const std::filesystem::path& db_path, int pool_size);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    const std::filesystem::path& db_path() const { return db_path_; }

    void shutdown();

private:
    void setup_schema();

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace docsearch_core
