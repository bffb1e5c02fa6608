#include "sift_core/classify/classifier_factory.hpp"

#include "sift_core/classify/heuristic_classifier.hpp"
#include "sift_core/classify/llm_classifier.hpp"

namespace sift_core {

ClassifierPtr make_classifier(const ClassifierSettings &settings,
                              std::shared_ptr<OllamaClient> client) {
  if (settings.backend == "heuristic") {
    return std::make_shared<HeuristicClassifier>();
  }
  if (settings.backend == "llm") {
    if (!client) {
      throw ConfigurationError("LLM classifier requires an Ollama client");
    }
    return std::make_shared<LlmClassifier>(std::move(client), settings.model,
                                           settings.retry_backoff);
  }
  throw ConfigurationError("Unknown classifier backend: " + settings.backend);
}

}  // namespace sift_core
