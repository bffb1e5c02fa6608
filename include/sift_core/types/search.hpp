#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/types/document.hpp"
#include "sift_core/types/document_class.hpp"

namespace sift_core {

// Metadata pre-filter shared by the vector and lexical searches. Empty lists mean "any".
struct SearchFilters {
  std::vector<DocumentClass> classes;
  std::vector<std::string> languages;
  std::vector<int64_t> document_ids;
  std::optional<std::chrono::system_clock::time_point> created_from;
  std::optional<std::chrono::system_clock::time_point> created_to;
  std::optional<std::string> knowledge_base;
};

struct SearchRequest {
  std::string query;
  std::optional<int> top_k;  // unset selects the configured default
  SearchFilters filters;
  bool include_context = false;
  std::optional<bool> rerank;  // unset follows configuration
  std::optional<std::chrono::milliseconds> timeout;
};

struct SearchResult {
  StoredChunk chunk;
  double score = 0.0;
  double vector_contribution = 0.0;
  double lexical_contribution = 0.0;
  std::optional<int> vector_rank;
  std::optional<int> lexical_rank;
  std::optional<float> rerank_score;
  std::optional<StoredChunk> previous;
  std::optional<StoredChunk> next;
};

struct SearchResponse {
  std::vector<SearchResult> results;
  bool reranked = false;
  bool degraded = false;   // query embedding failed, lexical results only
  bool timed_out = false;  // deadline hit before both searches finished
};

}  // namespace sift_core
