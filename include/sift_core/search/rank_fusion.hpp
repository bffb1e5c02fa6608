#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace sift_core {

inline constexpr int DEFAULT_RRF_K = 60;

struct FusedCandidate {
  int64_t chunk_id = 0;
  double score = 0.0;
  double vector_contribution = 0.0;
  double lexical_contribution = 0.0;
  std::optional<int> vector_rank;  // 1-based
  std::optional<int> lexical_rank;
};

/**
 * @brief Reciprocal Rank Fusion of two rankings (best first).
 *
 * A chunk at 1-based rank r contributes 1/(k + r) from each list it appears in; a chunk missing
 * from a list contributes nothing for it. Only the first occurrence of an id in a list counts.
 * Output is sorted by fused score descending, exact ties by ascending chunk id.
 *
 * @throw ValidationError if k <= 0.
 */
std::vector<FusedCandidate> reciprocal_rank_fusion(const std::vector<int64_t> &vector_ranking,
                                                   const std::vector<int64_t> &lexical_ranking,
                                                   int k = DEFAULT_RRF_K);

}  // namespace sift_core
