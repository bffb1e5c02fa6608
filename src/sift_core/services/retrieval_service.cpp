#include "sift_core/services/retrieval_service.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <iostream>
#include <optional>
#include <unordered_map>

#include "sift_core/search/rank_fusion.hpp"

namespace sift_core {

namespace {

using Clock = std::chrono::steady_clock;

template <typename T>
bool ready_by(std::future<T> &future, Clock::time_point deadline) {
  return future.valid() && future.wait_until(deadline) == std::future_status::ready;
}

// The job's result if it finished before the deadline.
template <typename T>
std::optional<T> collect_by(std::future<T> &future, Clock::time_point deadline) {
  if (!ready_by(future, deadline)) {
    return std::nullopt;
  }
  try {
    return future.get();
  } catch (const QueryExpiredError &) {
    return std::nullopt;
  }
}

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

RetrievalService::RetrievalService(std::shared_ptr<StorageService> storage,
                                   EmbedderPtr embedder,
                                   RerankerPtr reranker,
                                   const RetrievalSettings &settings,
                                   bool rerank_by_default)
    : storage_(std::move(storage)),
      embedder_(std::move(embedder)),
      reranker_(std::move(reranker)),
      settings_(settings),
      rerank_by_default_(rerank_by_default),
      query_pool_(static_cast<size_t>(std::max(1, settings.query_threads))) {}

SearchRequest RetrievalService::validate(const SearchRequest &request) const {
  SearchRequest validated = request;
  if (is_blank(request.query)) {
    throw ValidationError("Query must not be empty");
  }
  const int top_k = request.top_k.value_or(settings_.default_top_k);
  if (top_k <= 0) {
    throw ValidationError("top_k must be positive");
  }
  if (top_k > settings_.max_top_k) {
    throw ValidationError("top_k must not exceed " + std::to_string(settings_.max_top_k));
  }
  validated.top_k = top_k;

  if (request.timeout && request.timeout->count() <= 0) {
    throw ValidationError("timeout_ms must be positive");
  }
  validated.timeout = request.timeout.value_or(settings_.timeout);

  const auto &filters = request.filters;
  if (filters.created_from && filters.created_to && *filters.created_from > *filters.created_to) {
    throw ValidationError("created_from must not be after created_to");
  }
  return validated;
}

SearchResponse RetrievalService::search(const SearchRequest &raw_request) {
  const SearchRequest request = validate(raw_request);
  const auto top_k = static_cast<size_t>(*request.top_k);
  const auto deadline = Clock::now() + *request.timeout;
  const bool rerank = reranker_ && request.rerank.value_or(rerank_by_default_);
  const size_t keep = rerank ? top_k * static_cast<size_t>(std::max(1, settings_.rerank_fan_out))
                             : top_k;
  const size_t pool =
      std::max(keep, top_k * static_cast<size_t>(std::max(1, settings_.candidate_multiplier)));

  SearchResponse response;

  // 1. Embed the query
  std::vector<float> query_vector;
  {
    auto embedder = embedder_;
    const std::string query = request.query;
    auto embedding =
        query_pool_.submit([embedder, query]() { return embedder->embed(query); }, deadline);
    try {
      auto embedded = collect_by(embedding, deadline);
      if (embedded) {
        query_vector = std::move(*embedded);
      } else {
        std::cerr << "Warning: Query embedding did not finish before the deadline" << std::endl;
        response.degraded = true;
        response.timed_out = true;
      }
    } catch (const ProviderError &e) {
      std::cerr << "Warning: Query embedding failed, searching lexically only: " << e.what()
                << std::endl;
      response.degraded = true;
    }
  }
  if (Clock::now() >= deadline) {
    response.timed_out = true;
    return response;
  }

  // 2. Both searches on one snapshot
  auto snapshot = storage_->acquire_snapshot();
  auto storage = storage_;

  std::future<std::vector<VectorHit>> vector_future;
  if (!query_vector.empty()) {
    VectorFilter filter;
    filter.filters = request.filters;
    vector_future = query_pool_.submit(
        [storage, query_vector, pool, filter]() {
          return storage->vectors().search(query_vector, pool, filter);
        },
        deadline);
  }
  const std::string query = request.query;
  const SearchFilters filters = request.filters;
  auto lexical_future = query_pool_.submit(
      [storage, query, pool, filters]() {
        return storage->metadata().lexical_search(query, pool, filters);
      },
      deadline);

  std::vector<int64_t> vector_ranking;
  std::vector<int64_t> lexical_ranking;
  if (vector_future.valid()) {
    if (auto hits = collect_by(vector_future, deadline)) {
      for (const auto &hit : *hits) {
        vector_ranking.push_back(hit.chunk_id);
      }
    } else {
      response.timed_out = true;
    }
  }
  if (auto hits = collect_by(lexical_future, deadline)) {
    for (const auto &hit : *hits) {
      lexical_ranking.push_back(hit.chunk_id);
    }
  } else {
    response.timed_out = true;
  }

  // 3. Fuse and hydrate
  auto fused = reciprocal_rank_fusion(vector_ranking, lexical_ranking, settings_.rrf_k);
  if (fused.size() > keep) {
    fused.resize(keep);
  }
  std::vector<int64_t> ids;
  ids.reserve(fused.size());
  for (const auto &candidate : fused) {
    ids.push_back(candidate.chunk_id);
  }
  auto hydration = query_pool_.submit(
      [storage, ids]() { return storage->metadata().get_chunks(ids); }, deadline);
  auto hydrated = collect_by(hydration, deadline);
  if (!hydrated) {
    std::cerr << "Warning: Search ran out of time before loading " << ids.size() << " chunks"
              << std::endl;
    response.timed_out = true;
    return response;
  }
  std::unordered_map<int64_t, StoredChunk> chunks;
  for (auto &chunk : *hydrated) {
    chunks.emplace(chunk.id, std::move(chunk));
  }

  for (const auto &candidate : fused) {
    auto it = chunks.find(candidate.chunk_id);
    if (it == chunks.end()) {
      continue;
    }
    SearchResult result;
    result.chunk = std::move(it->second);
    result.score = candidate.score;
    result.vector_contribution = candidate.vector_contribution;
    result.lexical_contribution = candidate.lexical_contribution;
    result.vector_rank = candidate.vector_rank;
    result.lexical_rank = candidate.lexical_rank;
    response.results.push_back(std::move(result));
  }
  if (request.include_context) {
    for (auto &result : response.results) {
      if (Clock::now() >= deadline) {
        response.timed_out = true;
        break;
      }
      attach_context(result);
    }
  }
  snapshot.unlock();

  // 4. Rerank, unless the deadline already passed
  if (rerank && !response.results.empty()) {
    if (Clock::now() < deadline) {
      response.reranked = reranker_->rerank(request.query, response.results, top_k);
    } else {
      response.timed_out = true;
    }
  }
  if (response.results.size() > top_k) {
    response.results.resize(top_k);
  }
  return response;
}

void RetrievalService::attach_context(SearchResult &result) {
  try {
    result.previous = storage_->metadata().get_adjacent_chunk(result.chunk, Adjacency::Previous);
    result.next = storage_->metadata().get_adjacent_chunk(result.chunk, Adjacency::Next);
  } catch (const StorageError &e) {
    std::cerr << "Warning: Could not load context for chunk " << result.chunk.id << ": "
              << e.what() << std::endl;
  }
}

}  // namespace sift_core
