#pragma once
#include <sqlite_modern_cpp.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace margin_core {

// Fixed-size pool of open connections to the metadata database. Every
// connection enforces foreign keys and waits busy_timeout on a locked
// database before failing. get_connection() blocks until one is free.
class ConnectionPool {
public:
    static constexpr std::chrono::milliseconds DEFAULT_BUSY_TIMEOUT{5000};

    ConnectionPool(const std::string& db_path,
                   int pool_size,
                   std::chrono::milliseconds busy_timeout = DEFAULT_BUSY_TIMEOUT);

    std::unique_ptr<sqlite::database> get_connection();

    // Returns a connection to the pool.
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    // Connections currently idle in the pool
    size_t available();

private:
    std::unique_ptr<sqlite::database> open_connection() const;

    bool shutting_down_ = false;
    std::string db_path_;
    std::chrono::milliseconds busy_timeout_;
    std::queue<std::unique_ptr<sqlite::database>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace margin_core
