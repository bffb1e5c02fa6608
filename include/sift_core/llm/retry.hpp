#pragma once

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "sift_core/errors.hpp"

namespace sift_core {

inline constexpr std::chrono::milliseconds MAX_RETRY_BACKOFF{5000};

/*
Runs fn, and once more after the backoff when it throws a ProviderError. A second failure
propagates to the caller. Other exceptions are not retried.
*/
template <typename Fn>
auto call_with_retry(Fn &&fn, std::chrono::milliseconds backoff, const std::string &operation)
    -> decltype(fn()) {
  try {
    return fn();
  } catch (const ProviderError &e) {
    std::cerr << "Warning: " << operation << " failed, retrying in " << backoff.count()
              << "ms: " << e.what() << std::endl;
  }
  std::this_thread::sleep_for(std::min(backoff, MAX_RETRY_BACKOFF));
  return fn();
}

}  // namespace sift_core
