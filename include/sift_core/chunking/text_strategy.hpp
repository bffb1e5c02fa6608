#pragma once
#include "sift_core/chunking/chunking_strategy.hpp"

namespace sift_core {

// Paragraph packing with token overlap between consecutive chunks.
class TextStrategy : public ChunkingStrategy {
 public:
  using ChunkingStrategy::ChunkingStrategy;

  bool can_handle(DocumentClass doc_class) const override;
  std::vector<Span> split(std::string_view content, const ChunkContext& context) const override;
};

}  // namespace sift_core
