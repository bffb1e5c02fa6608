#pragma once

#include <cstddef>
#include <semaphore>

namespace sift_core {

// Caps in-flight calls to one provider. Shared by every job and query that talks to it.
class ConcurrencyLimiter {
 public:
  // Releases its slot when destroyed.
  class Permit {
   public:
    explicit Permit(ConcurrencyLimiter* limiter) : limiter_(limiter) {}
    ~Permit() {
      if (limiter_) {
        limiter_->semaphore_.release();
      }
    }
    Permit(Permit&& other) noexcept : limiter_(other.limiter_) {
      other.limiter_ = nullptr;
    }
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    Permit& operator=(Permit&&) = delete;

   private:
    ConcurrencyLimiter* limiter_;
  };

  explicit ConcurrencyLimiter(size_t max_concurrent)
      : capacity_(max_concurrent == 0 ? 1 : max_concurrent),
        semaphore_(static_cast<std::ptrdiff_t>(capacity_)) {}

  ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
  ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

  // Blocks until a slot is free.
  Permit acquire() {
    semaphore_.acquire();
    return Permit(this);
  }

  size_t capacity() const {
    return capacity_;
  }

 private:
  size_t capacity_;
  std::counting_semaphore<> semaphore_;
};

}  // namespace sift_core
