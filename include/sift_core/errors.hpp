#pragma once

#include <exception>
#include <string>

namespace sift_core {

enum class ErrorCode { Validation, Provider, Storage, NotFound, Configuration, Cancelled };

inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation: return "validation_error";
    case ErrorCode::Provider: return "provider_error";
    case ErrorCode::Storage: return "storage_error";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::Configuration: return "configuration_error";
    case ErrorCode::Cancelled: return "cancelled";
  }
  return "unknown";
}

class SiftError : public std::exception {
 public:
  SiftError(ErrorCode code, const std::string& message) : code_(code), message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
  std::string message_;
};

// Malformed input; always raised before any state is mutated.
class ValidationError : public SiftError {
 public:
  explicit ValidationError(const std::string& message)
      : SiftError(ErrorCode::Validation, message) {}
};

// Classifier, embedder or reranker backend failure.
class ProviderError : public SiftError {
 public:
  explicit ProviderError(const std::string& message) : SiftError(ErrorCode::Provider, message) {}
};

// Transaction or index write failure.
class StorageError : public SiftError {
 public:
  explicit StorageError(const std::string& message) : SiftError(ErrorCode::Storage, message) {}
};

class NotFoundError : public SiftError {
 public:
  explicit NotFoundError(const std::string& message) : SiftError(ErrorCode::NotFound, message) {}
};

class ConfigurationError : public SiftError {
 public:
  explicit ConfigurationError(const std::string& message)
      : SiftError(ErrorCode::Configuration, message) {}
};

class JobCancelledError : public SiftError {
 public:
  explicit JobCancelledError(const std::string& message)
      : SiftError(ErrorCode::Cancelled, message) {}
};

}  // namespace sift_core
