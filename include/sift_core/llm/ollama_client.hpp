#pragma once

#include <string>
#include <vector>

#include "sift_core/errors.hpp"

namespace sift_core {

class OllamaError : public ProviderError {
 public:
  explicit OllamaError(const std::string &message) : ProviderError(message) {}
};

// Thin wrapper over ollama-hpp. Every failure surfaces as OllamaError.
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::vector<float> get_embedding(const std::string &text);
  // One vector per input, in input order.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  // Single non-streamed completion.
  virtual std::string generate(const std::string &model, const std::string &prompt);

  virtual bool is_server_available();

  const std::string &url() const {
    return ollama_url_;
  }
  const std::string &embedding_model() const {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
};

}  // namespace sift_core
