#include "sift_api/server.hpp"

#include <iostream>
#include <stdexcept>

namespace sift_api {

Endpoint Server::parse_address(const std::string &address) {
  const size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    throw std::invalid_argument("Server address must have the form host:port, got '" + address +
                                "'");
  }
  const std::string port_text = address.substr(colon + 1);
  if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
      port_text.size() > 5) {
    throw std::invalid_argument("Server port must be a number, got '" + port_text + "'");
  }
  const int port = std::stoi(port_text);
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("Server port must be within 1-65535, got " + port_text);
  }
  return {address.substr(0, colon), static_cast<uint16_t>(port)};
}

Server::Server(const std::string &address) : endpoint_(parse_address(address)) {}

Server::~Server() {
  if (running_) {
    stop();
  }
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "Listening on " << endpoint_.host << ":" << endpoint_.port << std::endl;
  serving_ = std::async(std::launch::async, [this] {
    app_.port(endpoint_.port).bindaddr(endpoint_.host).multithreaded().run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (serving_.valid()) {
    serving_.get();
  }
  running_ = false;
}

}  // namespace sift_api
