#include "sift_core/chunking/fixed_window_strategy.hpp"

namespace sift_core {

bool FixedWindowStrategy::can_handle(DocumentClass /*doc_class*/) const {
  return true;
}

std::vector<Span> FixedWindowStrategy::split(std::string_view content,
                                             const ChunkContext& /*context*/) const {
  return fixed_windows(content, 0, content.size(), settings_.fixed.max_tokens,
                       settings_.fixed.overlap_tokens);
}

}  // namespace sift_core
