#pragma once

#include <string>
#include <string_view>

namespace sift_core {

class HashService {
 public:
  // Lowercase hex SHA-256 of the given bytes.
  static std::string sha256_hex(std::string_view content);
};

}  // namespace sift_core
