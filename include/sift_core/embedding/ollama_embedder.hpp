#pragma once

#include <chrono>
#include <memory>

#include "sift_core/embedding/embedder.hpp"
#include "sift_core/llm/concurrency_limiter.hpp"
#include "sift_core/llm/ollama_client.hpp"
#include "sift_core/settings.hpp"

namespace sift_core {

/*
Embeddings from an Ollama model. Batches are cut into sub-batches of settings.batch_size that run
concurrently, each holding a permit of the shared limiter. Every provider call is retried once.
*/
class OllamaEmbedder : public Embedder {
 public:
  OllamaEmbedder(std::shared_ptr<OllamaClient> client,
                 const EmbedderSettings& settings,
                 std::shared_ptr<ConcurrencyLimiter> limiter);

  std::vector<float> embed(const std::string& text) override;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
  int dimensions() const override {
    return settings_.dimensions;
  }

 private:
  std::vector<std::vector<float>> embed_sub_batch(const std::vector<std::string>& texts);
  void check_dimensions(const std::vector<float>& vector) const;

  std::shared_ptr<OllamaClient> client_;
  EmbedderSettings settings_;
  std::shared_ptr<ConcurrencyLimiter> limiter_;
};

// "ollama" is the only provider; anything else is a ConfigurationError.
EmbedderPtr make_embedder(const EmbedderSettings& settings,
                          std::shared_ptr<OllamaClient> client,
                          std::shared_ptr<ConcurrencyLimiter> limiter);

}  // namespace sift_core
