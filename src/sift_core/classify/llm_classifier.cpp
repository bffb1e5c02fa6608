#include "sift_core/classify/llm_classifier.hpp"

#include <iostream>

#include "sift_core/llm/retry.hpp"

namespace sift_core {

LlmClassifier::LlmClassifier(std::shared_ptr<OllamaClient> client,
                             std::string model,
                             std::chrono::milliseconds retry_backoff)
    : client_(std::move(client)), model_(std::move(model)), retry_backoff_(retry_backoff) {}

std::string LlmClassifier::build_prompt(std::string_view sample, const std::string &origin) {
  std::string prompt =
      "Classify the document below into exactly one of these classes: text, code, table, "
      "markdown, config, log, mixed.\n"
      "Answer with the class name only.\n\n";
  if (!origin.empty()) {
    prompt += "Filename: " + origin + "\n\n";
  }
  prompt += "Document:\n";
  prompt.append(sample.data(), sample.size());
  return prompt;
}

DocumentClass LlmClassifier::classify(std::string_view sample, const std::string &origin) const {
  const std::string prompt = build_prompt(sample, origin);
  std::string answer;
  try {
    answer = call_with_retry([&]() { return client_->generate(model_, prompt); }, retry_backoff_,
                             "Classification");
  } catch (const ProviderError &e) {
    std::cerr << "Warning: LLM classification unavailable, using heuristics: " << e.what()
              << std::endl;
    return fallback_.classify(sample, origin);
  }

  if (auto parsed = try_parse_document_class(answer)) {
    return *parsed;
  }
  std::cerr << "Warning: Unrecognized classifier answer '" << answer.substr(0, 64)
            << "', using heuristics" << std::endl;
  return fallback_.classify(sample, origin);
}

}  // namespace sift_core
