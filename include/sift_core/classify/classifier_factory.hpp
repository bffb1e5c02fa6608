#pragma once

#include <memory>

#include "sift_core/classify/classifier.hpp"
#include "sift_core/llm/ollama_client.hpp"
#include "sift_core/settings.hpp"

namespace sift_core {

// "heuristic" or "llm"; anything else is a ConfigurationError.
ClassifierPtr make_classifier(const ClassifierSettings &settings,
                              std::shared_ptr<OllamaClient> client);

}  // namespace sift_core
