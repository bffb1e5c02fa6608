#include "sift_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace sift_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  // Set the server URL for ollama-hpp
  ollama::setServerURL(ollama_url_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embeddings field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw OllamaError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (const auto &text : texts) {
    embeddings.push_back(get_embedding(text));
  }
  return embeddings;
}

std::string OllamaClient::generate(const std::string &model, const std::string &prompt) {
  try {
    ollama::response response = ollama::generate(model, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Generation with " + model + " failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace sift_core
