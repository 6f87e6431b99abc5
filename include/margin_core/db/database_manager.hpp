#pragma once

#include "margin_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace margin_core {

// Process-wide owner of the metadata database: creates the notebook, source
// and chunk tables, then hands out pooled connections to the services.
class DatabaseManager {
public:
    static DatabaseManager& get_instance();

    // Creates the parent directory and schema if needed. A second call while
    // initialized is ignored; call shutdown() first to switch databases.
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const { return is_initialized_; }
    const std::filesystem::path& db_path() const { return db_path_; }
    size_t available_connections();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    DatabaseManager() = default;
    static void setup_schema(const std::filesystem::path& db_path);

    std::unique_ptr<ConnectionPool> pool_;
    std::filesystem::path db_path_;
    bool is_initialized_ = false;
};

} // namespace margin_core
