#pragma once
#include "sift_core/chunking/chunking_strategy.hpp"

namespace sift_core {

// Row packing. The header row is recorded on every chunk and each chunk repeats the last row of
// its predecessor.
class TableStrategy : public ChunkingStrategy {
 public:
  using ChunkingStrategy::ChunkingStrategy;

  bool can_handle(DocumentClass doc_class) const override;
  std::vector<Span> split(std::string_view content, const ChunkContext& context) const override;
};

}  // namespace sift_core
