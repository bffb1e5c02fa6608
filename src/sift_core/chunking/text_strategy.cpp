#include "sift_core/chunking/text_strategy.hpp"

namespace sift_core {

bool TextStrategy::can_handle(DocumentClass doc_class) const {
  return doc_class == DocumentClass::Text;
}

std::vector<Span> TextStrategy::split(std::string_view content,
                                      const ChunkContext& /*context*/) const {
  auto paragraphs = split_paragraphs(content, 0, content.size());
  for (auto& paragraph : paragraphs) {
    paragraph.attributes.node_kind = "paragraphs";
  }
  auto spans = pack_units(content, paragraphs, settings_.text);
  apply_token_overlap(content, spans, settings_.text.overlap_tokens);
  return spans;
}

}  // namespace sift_core
