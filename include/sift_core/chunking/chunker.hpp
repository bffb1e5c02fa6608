#pragma once

#include <string_view>
#include <vector>

#include "sift_core/chunking/chunking_strategy.hpp"
#include "sift_core/settings.hpp"
#include "sift_core/types/chunk.hpp"

namespace sift_core {

/**
 * @class Chunker
 * @brief Splits classified content into chunks with the strategy registered for its class.
 *
 * A strategy that throws, or whose spans leave a gap in the source, is replaced by fixed token
 * windows for that document. Every returned chunk's content is exactly
 * source[start_offset, end_offset).
 */
class Chunker {
 public:
  explicit Chunker(const ChunkingSettings& settings);

  Chunker(const Chunker&) = delete;
  Chunker& operator=(const Chunker&) = delete;

  /**
   * @throw ValidationError if the content is empty, whitespace only or not valid UTF-8.
   */
  std::vector<Chunk> chunk(std::string_view content,
                           DocumentClass doc_class,
                           const ChunkContext& context) const;

  const ChunkingStrategy& strategy_for(DocumentClass doc_class) const;

  // First span starts at 0, last ends at size, each span ends past its predecessor and starts no
  // later than the predecessor's end.
  static bool covers(const std::vector<Span>& spans, size_t size);

 private:
  static bool starts_with_heading(std::string_view content, const Span& span);
  // A heading section stands alone whatever its size.
  void merge_trailing_fragment(std::string_view content,
                               std::vector<Span>& spans,
                               DocumentClass doc_class) const;
  std::vector<Chunk> build_chunks(std::string_view content,
                                  const std::vector<Span>& spans,
                                  DocumentClass doc_class) const;

  ChunkingSettings settings_;
  std::vector<ChunkingStrategyPtr> strategies_;
  ChunkingStrategyPtr fallback_;
};

}  // namespace sift_core
