#pragma once
#include "sift_core/chunking/chunking_strategy.hpp"

namespace sift_core {

// Entries start at a timestamp or level marker; continuation lines (stack traces) stay with their
// entry. Consecutive chunks share their boundary lines.
class LogStrategy : public ChunkingStrategy {
 public:
  using ChunkingStrategy::ChunkingStrategy;

  bool can_handle(DocumentClass doc_class) const override;
  std::vector<Span> split(std::string_view content, const ChunkContext& context) const override;
};

}  // namespace sift_core
