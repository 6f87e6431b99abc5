#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <sqlite_modern_cpp.h>

#include "margin_core/db/database_manager.hpp"

namespace margin_core {

// Raised when no metadata connection can be borrowed: the manager was never
// initialized or its pool has been shut down.
class ConnectionUnavailableError : public std::exception {
public:
    explicit ConnectionUnavailableError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

// Borrows one connection from the DatabaseManager pool for the lifetime of
// the guard. Moving transfers the borrow; only the last owner returns it.
class PooledConnection {
public:
    explicit PooledConnection(DatabaseManager& manager) : manager_(&manager) {
        try {
            conn_ = manager.get_connection();
        } catch (const std::runtime_error& e) {
            throw ConnectionUnavailableError(std::string("No metadata connection available: ") + e.what());
        }
        if (!conn_) {
            throw ConnectionUnavailableError("No metadata connection available: pool returned none");
        }
    }

    PooledConnection(PooledConnection&& other) noexcept
        : manager_(other.manager_), conn_(std::move(other.conn_)) {}

    PooledConnection& operator=(PooledConnection&& other) noexcept {
        if (this != &other) {
            release();
            manager_ = other.manager_;
            conn_ = std::move(other.conn_);
        }
        return *this;
    }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    ~PooledConnection() { release(); }

    sqlite::database& database() const { return *conn_; }
    sqlite::database* operator->() const { return conn_.get(); }
    sqlite::database& operator*() const { return *conn_; }

    bool owns_connection() const { return conn_ != nullptr; }

private:
    void release() noexcept {
        if (conn_) {
            manager_->return_connection(std::move(conn_));
        }
    }

    DatabaseManager* manager_;
    std::unique_ptr<sqlite::database> conn_;
};

}  // namespace margin_core
