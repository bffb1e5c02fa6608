#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace sift_api {

struct Endpoint {
  std::string host;
  uint16_t port = 0;
};

// Crow app bound to one endpoint, served from a background thread between start() and stop().
class Server {
 public:
  // "host:port" as in the api_base_url setting.
  explicit Server(const std::string &address);
  ~Server();

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  /**
   * @brief Splits "host:port" at the last colon.
   * @throw std::invalid_argument for a missing host, or a port outside 1-65535.
   */
  static Endpoint parse_address(const std::string &address);

  crow::SimpleApp &get_app() {
    return app_;
  }
  const Endpoint &endpoint() const {
    return endpoint_;
  }

  void start();
  // Blocks until the serving thread has returned.
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  Endpoint endpoint_;
  std::future<void> serving_;
  bool running_ = false;
};

}  // namespace sift_api
