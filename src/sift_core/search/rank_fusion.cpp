#include "sift_core/search/rank_fusion.hpp"

#include <algorithm>
#include <unordered_map>

#include "sift_core/errors.hpp"

namespace sift_core {

std::vector<FusedCandidate> reciprocal_rank_fusion(const std::vector<int64_t> &vector_ranking,
                                                   const std::vector<int64_t> &lexical_ranking,
                                                   int k) {
  if (k <= 0) {
    throw ValidationError("RRF constant must be positive, got " + std::to_string(k));
  }

  std::vector<FusedCandidate> fused;
  std::unordered_map<int64_t, size_t> positions;
  auto candidate_for = [&](int64_t chunk_id) -> FusedCandidate & {
    auto [it, inserted] = positions.emplace(chunk_id, fused.size());
    if (inserted) {
      FusedCandidate candidate;
      candidate.chunk_id = chunk_id;
      fused.push_back(candidate);
    }
    return fused[it->second];
  };

  for (size_t i = 0; i < vector_ranking.size(); ++i) {
    FusedCandidate &candidate = candidate_for(vector_ranking[i]);
    if (candidate.vector_rank) {
      continue;
    }
    const int rank = static_cast<int>(i) + 1;
    candidate.vector_rank = rank;
    candidate.vector_contribution = 1.0 / static_cast<double>(k + rank);
  }
  for (size_t i = 0; i < lexical_ranking.size(); ++i) {
    FusedCandidate &candidate = candidate_for(lexical_ranking[i]);
    if (candidate.lexical_rank) {
      continue;
    }
    const int rank = static_cast<int>(i) + 1;
    candidate.lexical_rank = rank;
    candidate.lexical_contribution = 1.0 / static_cast<double>(k + rank);
  }

  for (auto &candidate : fused) {
    candidate.score = candidate.vector_contribution + candidate.lexical_contribution;
  }
  std::sort(fused.begin(), fused.end(), [](const FusedCandidate &a, const FusedCandidate &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.chunk_id < b.chunk_id;
  });
  return fused;
}

}  // namespace sift_core
