#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "sift_core/classify/heuristic_classifier.hpp"
#include "sift_core/llm/ollama_client.hpp"

namespace sift_core {

/*
Asks an Ollama model for a single class label. A provider failure is retried once; a second
failure, or an answer that is not a class label, falls back to the heuristic classifier.
*/
class LlmClassifier : public Classifier {
 public:
  LlmClassifier(std::shared_ptr<OllamaClient> client,
                std::string model,
                std::chrono::milliseconds retry_backoff);

  DocumentClass classify(std::string_view sample, const std::string &origin) const override;

  static std::string build_prompt(std::string_view sample, const std::string &origin);

 private:
  std::shared_ptr<OllamaClient> client_;
  std::string model_;
  std::chrono::milliseconds retry_backoff_;
  HeuristicClassifier fallback_;
};

}  // namespace sift_core
