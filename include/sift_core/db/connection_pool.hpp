#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace sift_core {

/*
Fixed set of keyed SQLCipher connections shared by workers, request handlers and query threads.
A caller that cannot get a connection within the acquire timeout fails with StorageError instead
of queueing behind a saturated pool indefinitely.
*/
class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path,
                 const std::string &db_key,
                 int pool_size,
                 std::chrono::milliseconds acquire_timeout);

  // Throws StorageError on timeout or once shutdown() has been called.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  size_t idle() const;

  // Opens and keys one connection, enabling foreign keys, WAL and the busy timeout.
  static std::unique_ptr<sqlite::database> open_keyed(const std::string &db_path,
                                                      const std::string &db_key);

 private:
  bool shutting_down_ = false;
  std::chrono::milliseconds acquire_timeout_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace sift_core
