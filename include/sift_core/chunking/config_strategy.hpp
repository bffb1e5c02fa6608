#pragma once
#include "sift_core/chunking/chunking_strategy.hpp"

namespace sift_core {

/*
Splits at top-level keys or sections, packing small neighbours together. JSON splits at depth-1
keys; YAML, TOML, INI and .env split at unindented keys and [section] headers, with the comment
block directly above a key kept with it.
*/
class ConfigStrategy : public ChunkingStrategy {
 public:
  using ChunkingStrategy::ChunkingStrategy;

  bool can_handle(DocumentClass doc_class) const override;
  std::vector<Span> split(std::string_view content, const ChunkContext& context) const override;

 private:
  struct Boundary {
    size_t position;
    std::string key;
  };

  // Throws ChunkingError on unbalanced JSON.
  std::vector<Boundary> json_boundaries(std::string_view content) const;
  std::vector<Boundary> line_boundaries(std::string_view content) const;
};

}  // namespace sift_core
