#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sift_core/errors.hpp"

namespace sift_core {

// A provider answered with vectors of the wrong size.
class DimensionMismatchError : public ProviderError {
 public:
  explicit DimensionMismatchError(const std::string& message) : ProviderError(message) {}
};

class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> embed(const std::string& text) = 0;
  // Output order matches input order.
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;
  virtual int dimensions() const = 0;
};

using EmbedderPtr = std::shared_ptr<Embedder>;

/**
 * @brief Startup check that the configured, indexed and actually returned dimensions agree.
 *
 * Embeds a short sample text.
 * @throw ConfigurationError on any mismatch.
 * @throw ProviderError if embedding the sample fails.
 */
void verify_dimensions(Embedder& embedder, int index_dimensions);

}  // namespace sift_core
