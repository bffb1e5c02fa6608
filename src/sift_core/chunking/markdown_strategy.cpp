#include "sift_core/chunking/markdown_strategy.hpp"

#include <optional>

#include "sift_core/chunking/token_estimator.hpp"
#include "sift_core/classify/line_markers.hpp"

namespace sift_core {

bool MarkdownStrategy::can_handle(DocumentClass doc_class) const {
  return doc_class == DocumentClass::Markdown;
}

std::vector<MarkdownStrategy::Section> MarkdownStrategy::find_sections(
    std::string_view content) const {
  std::vector<Section> sections;
  sections.push_back({0, content.size(), ""});

  bool in_fence = false;
  for (const auto& line : split_lines(content, 0, content.size())) {
    std::string_view text = content.substr(line.start, line.end - line.start);
    if (is_fence_line(text)) {
      in_fence = !in_fence;
      continue;
    }
    if (in_fence || !is_markdown_heading(text)) {
      continue;
    }
    if (line.start == 0) {
      sections.back().title = markdown_heading_text(text);
      continue;
    }
    sections.back().end = line.start;
    sections.push_back({line.start, content.size(), markdown_heading_text(text)});
  }
  return sections;
}

bool MarkdownStrategy::has_body(std::string_view content, const Section& section) {
  size_t body_start = section.start;
  if (!section.title.empty()) {
    const size_t newline = content.find('\n', section.start);
    body_start = newline == std::string_view::npos || newline >= section.end ? section.end
                                                                              : newline + 1;
  }
  return !is_blank_line(content.substr(body_start, section.end - body_start));
}

std::vector<Span> MarkdownStrategy::section_blocks(std::string_view content,
                                                   size_t start,
                                                   size_t end) const {
  std::vector<Span> blocks;
  size_t current = start;
  bool in_fence = false;

  auto push = [&](size_t block_end, bool atomic) {
    if (block_end > current) {
      Span block;
      block.start = current;
      block.end = block_end;
      block.atomic = atomic;
      blocks.push_back(std::move(block));
      current = block_end;
    }
  };

  for (const auto& line : split_lines(content, start, end)) {
    std::string_view text = content.substr(line.start, line.end - line.start);
    if (is_fence_line(text)) {
      if (!in_fence) {
        push(line.start, false);
        in_fence = true;
      } else {
        in_fence = false;
        push(line.end, true);
      }
      continue;
    }
    if (!in_fence && is_blank_line(text)) {
      push(line.end, false);
    }
  }
  // An unterminated fence runs to the end of the section
  push(end, in_fence);
  return blocks;
}

std::vector<Span> MarkdownStrategy::split(std::string_view content,
                                          const ChunkContext& /*context*/) const {
  std::vector<Section> sections = find_sections(content);

  // A heading without a body folds into the next section and keeps its own title; a trailing
  // one folds back into its predecessor
  std::vector<Section> folded;
  std::optional<Section> pending;
  for (auto& section : sections) {
    if (pending) {
      section.start = pending->start;
      if (!pending->title.empty()) {
        section.title = pending->title;
      }
      pending.reset();
    }
    if (!has_body(content, section)) {
      pending = std::move(section);
      continue;
    }
    folded.push_back(std::move(section));
  }
  if (pending) {
    if (folded.empty()) {
      folded.push_back(std::move(*pending));
    } else {
      folded.back().end = pending->end;
    }
  }

  std::vector<Span> spans;
  for (const auto& section : folded) {
    ChunkAttributes attributes;
    attributes.node_kind = "section";
    attributes.symbol_name = section.title;

    const size_t tokens =
        estimate_tokens(content.substr(section.start, section.end - section.start));
    if (tokens <= settings_.markdown.max_tokens) {
      Span span;
      span.start = section.start;
      span.end = section.end;
      span.attributes = attributes;
      spans.push_back(std::move(span));
      continue;
    }

    auto blocks = section_blocks(content, section.start, section.end);
    for (auto& block : blocks) {
      block.attributes = attributes;
    }
    auto pieces = pack_units(content, blocks, settings_.markdown);
    apply_token_overlap(content, pieces, settings_.markdown.overlap_tokens);
    spans.insert(spans.end(), pieces.begin(), pieces.end());
  }
  return spans;
}

}  // namespace sift_core
