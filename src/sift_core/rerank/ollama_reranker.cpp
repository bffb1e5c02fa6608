#include "sift_core/rerank/ollama_reranker.hpp"

#include <algorithm>
#include <future>
#include <regex>

#include "sift_core/llm/retry.hpp"

namespace sift_core {

namespace {
constexpr size_t MAX_PASSAGE_BYTES = 4000;
}

OllamaReranker::OllamaReranker(std::shared_ptr<OllamaClient> client,
                               const RerankerSettings& settings,
                               std::shared_ptr<ConcurrencyLimiter> limiter)
    : client_(std::move(client)), settings_(settings), limiter_(std::move(limiter)) {}

std::string OllamaReranker::build_prompt(const std::string& query, const std::string& passage) {
  return "Rate how relevant the passage is to the query on a scale from 0 (unrelated) to 10 "
         "(answers it directly). Answer with the number only.\n\nQuery: " +
         query + "\n\nPassage:\n" + passage.substr(0, MAX_PASSAGE_BYTES);
}

std::optional<float> OllamaReranker::parse_score(const std::string& answer) {
  static const std::regex number_regex(R"((\d+(?:\.\d+)?))");
  std::smatch match;
  if (!std::regex_search(answer, match, number_regex)) {
    return std::nullopt;
  }
  float value = std::stof(match[1].str());
  return std::clamp(value, 0.0f, 10.0f);
}

float OllamaReranker::score_pair(const std::string& query, const std::string& passage) {
  auto permit = limiter_->acquire();
  const std::string prompt = build_prompt(query, passage);
  std::string answer = call_with_retry([&]() { return client_->generate(settings_.model, prompt); },
                                       settings_.retry_backoff, "Rerank scoring");
  auto parsed = parse_score(answer);
  if (!parsed) {
    throw ProviderError("Reranker answer is not a score: " + answer.substr(0, 64));
  }
  return *parsed;
}

std::vector<float> OllamaReranker::score(const std::string& query,
                                         const std::vector<std::string>& passages) {
  std::vector<std::future<float>> futures;
  futures.reserve(passages.size());
  for (const auto& passage : passages) {
    futures.push_back(std::async(std::launch::async,
                                 [this, &query, &passage]() { return score_pair(query, passage); }));
  }

  std::vector<float> scores;
  scores.reserve(passages.size());
  std::exception_ptr failure;
  for (auto& future : futures) {
    try {
      scores.push_back(future.get());
    } catch (...) {
      if (!failure) {
        failure = std::current_exception();
      }
    }
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
  return scores;
}

}  // namespace sift_core
