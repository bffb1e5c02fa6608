#pragma once

#include <memory>
#include <optional>

#include "sift_core/llm/concurrency_limiter.hpp"
#include "sift_core/llm/ollama_client.hpp"
#include "sift_core/rerank/reranker.hpp"
#include "sift_core/settings.hpp"

namespace sift_core {

// Pairwise relevance from an Ollama model prompted for a 0-10 score. Pairs are scored
// concurrently under the provider limiter.
class OllamaReranker : public Reranker {
 public:
  OllamaReranker(std::shared_ptr<OllamaClient> client,
                 const RerankerSettings& settings,
                 std::shared_ptr<ConcurrencyLimiter> limiter);

  std::vector<float> score(const std::string& query,
                           const std::vector<std::string>& passages) override;

  static std::string build_prompt(const std::string& query, const std::string& passage);
  // First number in the answer, clamped to [0, 10].
  static std::optional<float> parse_score(const std::string& answer);

 private:
  float score_pair(const std::string& query, const std::string& passage);

  std::shared_ptr<OllamaClient> client_;
  RerankerSettings settings_;
  std::shared_ptr<ConcurrencyLimiter> limiter_;
};

}  // namespace sift_core
