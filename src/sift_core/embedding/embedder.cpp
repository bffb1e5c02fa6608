#include "sift_core/embedding/embedder.hpp"

namespace sift_core {

void verify_dimensions(Embedder& embedder, int index_dimensions) {
  const int configured = embedder.dimensions();
  if (configured != index_dimensions) {
    throw ConfigurationError("Embedder is configured for " + std::to_string(configured) +
                             " dimensions but the vector index holds " +
                             std::to_string(index_dimensions));
  }
  std::vector<float> sample;
  try {
    sample = embedder.embed("dimension check");
  } catch (const DimensionMismatchError& e) {
    throw ConfigurationError(e.what());
  }
  if (static_cast<int>(sample.size()) != configured) {
    throw ConfigurationError("Embedding provider returned " + std::to_string(sample.size()) +
                             " dimensions, configured " + std::to_string(configured));
  }
}

}  // namespace sift_core
