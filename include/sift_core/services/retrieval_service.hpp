#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "sift_core/embedding/embedder.hpp"
#include "sift_core/rerank/reranker.hpp"
#include "sift_core/search/query_pool.hpp"
#include "sift_core/services/storage_service.hpp"
#include "sift_core/settings.hpp"
#include "sift_core/types/search.hpp"

namespace sift_core {

/*
Hybrid retrieval: the query embedding drives a filtered k-NN over the vector index while an FTS5
BM25 search runs over the same filtered chunks, both on one storage snapshot. The two rankings are
fused with RRF and optionally reranked.

When the query cannot be embedded the search continues lexical-only and the response is marked
degraded. When the deadline passes, whatever finished is returned and the response is marked
timed_out; unfinished searches are abandoned, never waited on. The blocking steps run on a fixed
query pool, so abandoned work stays bounded by settings.query_threads.
*/
class RetrievalService {
 public:
  RetrievalService(std::shared_ptr<StorageService> storage,
                   EmbedderPtr embedder,
                   RerankerPtr reranker,
                   const RetrievalSettings &settings,
                   bool rerank_by_default);

  /**
   * @throw ValidationError for an empty query, top_k outside [1, max_top_k], a non-positive
   * timeout or an inverted date range.
   * @throw StorageError if a search fails outright.
   */
  SearchResponse search(const SearchRequest &request);

 private:
  // Applies defaults and rejects malformed requests.
  SearchRequest validate(const SearchRequest &request) const;
  void attach_context(SearchResult &result);

  std::shared_ptr<StorageService> storage_;
  EmbedderPtr embedder_;
  RerankerPtr reranker_;
  RetrievalSettings settings_;
  bool rerank_by_default_;
  // Last member: joined before the services its jobs use are released
  QueryPool query_pool_;
};

}  // namespace sift_core
