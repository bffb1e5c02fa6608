#include "sift_core/embedding/ollama_embedder.hpp"

#include <algorithm>
#include <future>

#include "sift_core/llm/retry.hpp"

namespace sift_core {

OllamaEmbedder::OllamaEmbedder(std::shared_ptr<OllamaClient> client,
                               const EmbedderSettings& settings,
                               std::shared_ptr<ConcurrencyLimiter> limiter)
    : client_(std::move(client)), settings_(settings), limiter_(std::move(limiter)) {
  if (settings_.batch_size == 0) {
    settings_.batch_size = 1;
  }
}

void OllamaEmbedder::check_dimensions(const std::vector<float>& vector) const {
  if (static_cast<int>(vector.size()) != settings_.dimensions) {
    throw DimensionMismatchError("Embedding model " + settings_.model + " returned " +
                                 std::to_string(vector.size()) + " dimensions, expected " +
                                 std::to_string(settings_.dimensions));
  }
}

std::vector<float> OllamaEmbedder::embed(const std::string& text) {
  auto permit = limiter_->acquire();
  std::vector<float> vector = call_with_retry([&]() { return client_->get_embedding(text); },
                                              settings_.retry_backoff, "Embedding");
  check_dimensions(vector);
  return vector;
}

std::vector<std::vector<float>> OllamaEmbedder::embed_sub_batch(
    const std::vector<std::string>& texts) {
  auto permit = limiter_->acquire();
  auto vectors = call_with_retry([&]() { return client_->get_embeddings(texts); },
                                 settings_.retry_backoff, "Batch embedding");
  if (vectors.size() != texts.size()) {
    throw ProviderError("Embedding provider returned " + std::to_string(vectors.size()) +
                        " vectors for " + std::to_string(texts.size()) + " texts");
  }
  for (const auto& vector : vectors) {
    check_dimensions(vector);
  }
  return vectors;
}

std::vector<std::vector<float>> OllamaEmbedder::embed_batch(const std::vector<std::string>& texts) {
  std::vector<std::future<std::vector<std::vector<float>>>> futures;
  for (size_t begin = 0; begin < texts.size(); begin += settings_.batch_size) {
    const size_t end = std::min(texts.size(), begin + settings_.batch_size);
    std::vector<std::string> sub_batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
    futures.push_back(std::async(std::launch::async, [this, sub_batch = std::move(sub_batch)]() {
      return embed_sub_batch(sub_batch);
    }));
  }

  // Collect in submission order; get() rethrows the first failure after the others finish
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  std::exception_ptr failure;
  for (auto& future : futures) {
    try {
      auto part = future.get();
      for (auto& vector : part) {
        vectors.push_back(std::move(vector));
      }
    } catch (...) {
      if (!failure) {
        failure = std::current_exception();
      }
    }
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
  return vectors;
}

EmbedderPtr make_embedder(const EmbedderSettings& settings,
                          std::shared_ptr<OllamaClient> client,
                          std::shared_ptr<ConcurrencyLimiter> limiter) {
  if (settings.provider != "ollama") {
    throw ConfigurationError("Unknown embedding provider: " + settings.provider);
  }
  if (settings.dimensions <= 0) {
    throw ConfigurationError("Embedding dimensions must be positive");
  }
  return std::make_shared<OllamaEmbedder>(std::move(client), settings, std::move(limiter));
}

}  // namespace sift_core
