#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "../../common/utilities_test.hpp"
#include "margin_core/db/connection_pool.hpp"
#include "margin_core/db/database_manager.hpp"
#include "margin_core/db/pooled_connection.hpp"

namespace margin_core {

class ConnectionPoolTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_db_path_ = margin_tests::TestUtilities::create_temp_test_db();
    auto &mgr = DatabaseManager::get_instance();
    mgr.shutdown();
    mgr.initialize(temp_db_path_, /*pool_size*/ 4);
  }

  void TearDown() override {
    DatabaseManager::get_instance().shutdown();
    margin_tests::TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  auto &mgr = DatabaseManager::get_instance();

  EXPECT_EQ(mgr.available_connections(), 4u);
  {
    PooledConnection c1(mgr);
    PooledConnection c2(mgr);
    EXPECT_EQ(mgr.available_connections(), 2u);

    int count = 0;
    *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    EXPECT_GE(count, 0);
  }
  EXPECT_EQ(mgr.available_connections(), 4u);
}

TEST_F(ConnectionPoolTest, ConnectionsApplyPragmas) {
  ConnectionPool pool(temp_db_path_.string(), 1, std::chrono::milliseconds(1234));
  auto conn = pool.get_connection();

  int fk_on = 0;
  int busy_timeout = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  *conn << "PRAGMA busy_timeout;" >> busy_timeout;
  EXPECT_EQ(fk_on, 1);
  EXPECT_EQ(busy_timeout, 1234);

  pool.return_connection(std::move(conn));
  EXPECT_EQ(pool.available(), 1u);
  pool.shutdown();
  EXPECT_THROW(pool.get_connection(), std::runtime_error);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  auto &mgr = DatabaseManager::get_instance();

  auto holder1 = std::make_unique<PooledConnection>(mgr);
  auto holder2 = std::make_unique<PooledConnection>(mgr);
  auto holder3 = std::make_unique<PooledConnection>(mgr);
  auto holder4 = std::make_unique<PooledConnection>(mgr);

  std::promise<void> start_promise;
  std::shared_future<void> start_future(start_promise.get_future());

  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    start_future.wait();
    PooledConnection c5(mgr);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  start_promise.set_value();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset();  // returns connection to pool

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, ConnectionsShareOneDatabase) {
  auto &mgr = DatabaseManager::get_instance();
  {
    PooledConnection writer(mgr);
    *writer << "INSERT INTO notebooks (id, title, created_at) VALUES ('nb1', 'One', '2024-01-01 00:00:00')";
  }

  PooledConnection a(mgr);
  PooledConnection b(mgr);
  int seen_a = 0;
  int seen_b = 0;
  *a << "SELECT COUNT(*) FROM notebooks" >> seen_a;
  *b << "SELECT COUNT(*) FROM notebooks" >> seen_b;
  EXPECT_EQ(seen_a, 1);
  EXPECT_EQ(seen_b, 1);
}

TEST_F(ConnectionPoolTest, ShutdownRejectsNewBorrowers) {
  auto &mgr = DatabaseManager::get_instance();
  mgr.shutdown();

  EXPECT_FALSE(mgr.is_initialized());
  EXPECT_EQ(mgr.available_connections(), 0u);
  EXPECT_THROW(PooledConnection conn(mgr), ConnectionUnavailableError);
}

TEST_F(ConnectionPoolTest, MovedGuardReturnsConnectionOnce) {
  auto &mgr = DatabaseManager::get_instance();
  {
    PooledConnection first(mgr);
    PooledConnection second(std::move(first));
    EXPECT_FALSE(first.owns_connection());
    EXPECT_TRUE(second.owns_connection());
    EXPECT_EQ(mgr.available_connections(), 3u);

    PooledConnection third(mgr);
    third = std::move(second);
    EXPECT_EQ(mgr.available_connections(), 3u);

    int count = 0;
    third.database() << "SELECT COUNT(*) FROM notebooks" >> count;
    EXPECT_EQ(count, 0);
  }
  EXPECT_EQ(mgr.available_connections(), 4u);
}

}  // namespace margin_core
