#include "sift_core/rerank/reranker.hpp"

#include <algorithm>
#include <iostream>

namespace sift_core {

bool Reranker::rerank(const std::string& query,
                      std::vector<SearchResult>& candidates,
                      size_t top_k) {
  auto keep_fused_order = [&]() {
    if (candidates.size() > top_k) {
      candidates.resize(top_k);
    }
    return false;
  };
  if (candidates.empty()) {
    return false;
  }

  std::vector<std::string> passages;
  passages.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    passages.push_back(candidate.chunk.content);
  }

  std::vector<float> scores;
  try {
    scores = score(query, passages);
  } catch (const std::exception& e) {
    std::cerr << "Warning: Reranking failed, keeping fused order: " << e.what() << std::endl;
    return keep_fused_order();
  }
  if (scores.size() != candidates.size()) {
    std::cerr << "Warning: Reranker returned " << scores.size() << " scores for "
              << candidates.size() << " candidates, keeping fused order" << std::endl;
    return keep_fused_order();
  }

  for (size_t i = 0; i < candidates.size(); ++i) {
    candidates[i].rerank_score = scores[i];
  }
  std::sort(candidates.begin(), candidates.end(), [](const SearchResult& a, const SearchResult& b) {
    if (*a.rerank_score != *b.rerank_score) {
      return *a.rerank_score > *b.rerank_score;
    }
    return a.chunk.id < b.chunk.id;
  });
  if (candidates.size() > top_k) {
    candidates.resize(top_k);
  }
  return true;
}

}  // namespace sift_core
