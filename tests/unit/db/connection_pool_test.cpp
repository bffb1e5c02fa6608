#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "../../common/utilities_test.hpp"
#include "sift_core/db/database_manager.hpp"
#include "sift_core/db/pooled_connection.hpp"
#include "sift_core/errors.hpp"

namespace sift_core {

class ConnectionPoolTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_db_path_ = sift_tests::TestUtilities::create_temp_test_db();
    auto &mgr = DatabaseManager::get_instance();
    mgr.shutdown();
    mgr.initialize(temp_db_path_, "sift_test_key", /*pool_size*/ 4);
  }

  void TearDown() override {
    DatabaseManager::get_instance().shutdown();
    sift_tests::TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  auto &mgr = DatabaseManager::get_instance();

  PooledConnection c1(mgr);
  PooledConnection c2(mgr);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GT(count, 0);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  auto &mgr = DatabaseManager::get_instance();

  // Exhaust pool (size=4 from SetUp)
  auto holder1 = std::make_unique<PooledConnection>(mgr);
  auto holder2 = std::make_unique<PooledConnection>(mgr);
  auto holder3 = std::make_unique<PooledConnection>(mgr);
  auto holder4 = std::make_unique<PooledConnection>(mgr);

  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    PooledConnection c5(mgr);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset();  // returns connection to pool

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, ExhaustedPoolFailsAfterAcquireTimeout) {
  auto &mgr = DatabaseManager::get_instance();
  mgr.shutdown();
  mgr.initialize(temp_db_path_, "sift_test_key", /*pool_size*/ 2, std::chrono::milliseconds(100));

  {
    PooledConnection c1(mgr);
    PooledConnection c2(mgr);
    EXPECT_EQ(mgr.idle_connections(), 0);

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(PooledConnection c3(mgr), StorageError);
    auto waited = std::chrono::steady_clock::now() - started;
    EXPECT_GE(waited, std::chrono::milliseconds(100));
    EXPECT_LT(waited, std::chrono::seconds(2));
  }
  EXPECT_EQ(mgr.idle_connections(), 2);
}

TEST_F(ConnectionPoolTest, RejectsNonPositiveAcquireTimeout) {
  auto &mgr = DatabaseManager::get_instance();
  mgr.shutdown();
  EXPECT_THROW(mgr.initialize(temp_db_path_, "sift_test_key", 2, std::chrono::milliseconds(0)),
               ConfigurationError);
  EXPECT_FALSE(mgr.is_initialized());
}

}  // namespace sift_core
