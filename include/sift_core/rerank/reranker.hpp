#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sift_core/types/search.hpp"

namespace sift_core {

class Reranker {
 public:
  virtual ~Reranker() = default;

  // One relevance score per passage, in passage order. Throws on provider failure.
  virtual std::vector<float> score(const std::string& query,
                                   const std::vector<std::string>& passages) = 0;

  /**
   * @brief Sorts candidates by relevance score (descending, ties by chunk id) and keeps top_k.
   *
   * On any failure, including a score count that does not match the candidates, the fused order
   * is kept and truncated instead.
   * @return true if the candidates were reordered by score.
   */
  bool rerank(const std::string& query, std::vector<SearchResult>& candidates, size_t top_k);
};

using RerankerPtr = std::shared_ptr<Reranker>;

}  // namespace sift_core
