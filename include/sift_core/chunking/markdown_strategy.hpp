#pragma once
#include "sift_core/chunking/chunking_strategy.hpp"

namespace sift_core {

/*
One chunk per ATX section, whatever its size. A heading with no body merges into the section
that follows; sections above the maximum are packed from their blocks, with overlap only between the
pieces of that section. A fenced block is never split.
*/
class MarkdownStrategy : public ChunkingStrategy {
 public:
  using ChunkingStrategy::ChunkingStrategy;

  bool can_handle(DocumentClass doc_class) const override;
  std::vector<Span> split(std::string_view content, const ChunkContext& context) const override;

 private:
  struct Section {
    size_t start;
    size_t end;
    std::string title;
  };

  std::vector<Section> find_sections(std::string_view content) const;
  // False for a bare heading, or a preamble that is only whitespace.
  static bool has_body(std::string_view content, const Section& section);
  // Paragraph blocks of a section; fenced blocks come out whole and atomic.
  std::vector<Span> section_blocks(std::string_view content, size_t start, size_t end) const;
};

}  // namespace sift_core
