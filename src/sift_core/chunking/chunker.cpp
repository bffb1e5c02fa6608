#include "sift_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iostream>

#include "sift_core/chunking/code_strategy.hpp"
#include "sift_core/chunking/config_strategy.hpp"
#include "sift_core/chunking/fixed_window_strategy.hpp"
#include "sift_core/chunking/log_strategy.hpp"
#include "sift_core/chunking/markdown_strategy.hpp"
#include "sift_core/chunking/mixed_strategy.hpp"
#include "sift_core/chunking/table_strategy.hpp"
#include "sift_core/chunking/text_strategy.hpp"
#include "sift_core/chunking/token_estimator.hpp"
#include "sift_core/classify/language_detector.hpp"
#include "sift_core/classify/line_markers.hpp"
#include "sift_core/errors.hpp"

namespace sift_core {

Chunker::Chunker(const ChunkingSettings& settings) : settings_(settings) {
  strategies_.push_back(std::make_unique<TextStrategy>(settings_));
  strategies_.push_back(std::make_unique<MarkdownStrategy>(settings_));
  strategies_.push_back(std::make_unique<TableStrategy>(settings_));
  strategies_.push_back(std::make_unique<ConfigStrategy>(settings_));
  strategies_.push_back(std::make_unique<LogStrategy>(settings_));
  strategies_.push_back(std::make_unique<CodeStrategy>(settings_));

  std::vector<const ChunkingStrategy*> region_strategies;
  for (const auto& strategy : strategies_) {
    region_strategies.push_back(strategy.get());
  }
  strategies_.push_back(std::make_unique<MixedStrategy>(settings_, std::move(region_strategies)));
  fallback_ = std::make_unique<FixedWindowStrategy>(settings_);
}

const ChunkingStrategy& Chunker::strategy_for(DocumentClass doc_class) const {
  for (const auto& strategy : strategies_) {
    if (strategy->can_handle(doc_class)) {
      return *strategy;
    }
  }
  return *fallback_;
}

bool Chunker::covers(const std::vector<Span>& spans, size_t size) {
  if (spans.empty() || spans.front().start != 0 || spans.back().end != size) {
    return false;
  }
  for (size_t i = 0; i < spans.size(); ++i) {
    if (spans[i].start >= spans[i].end) {
      return false;
    }
    if (i == 0) {
      continue;
    }
    const Span& prev = spans[i - 1];
    if (spans[i].start > prev.end || spans[i].start <= prev.start || spans[i].end <= prev.end) {
      return false;
    }
  }
  return true;
}

std::vector<Chunk> Chunker::chunk(std::string_view content,
                                  DocumentClass doc_class,
                                  const ChunkContext& context) const {
  if (is_blank_line(content)) {
    throw ValidationError("Cannot chunk empty content");
  }
  if (!utf8::is_valid(content.begin(), content.end())) {
    throw ValidationError("Content is not valid UTF-8");
  }

  const ChunkingStrategy& strategy = strategy_for(doc_class);
  std::vector<Span> spans;
  try {
    spans = strategy.split(content, context);
    if (!covers(spans, content.size())) {
      std::cerr << "Warning: " << to_string(doc_class) << " chunking of '" << context.origin
                << "' left gaps in the source, falling back to fixed windows" << std::endl;
      spans.clear();
    }
  } catch (const std::exception& e) {
    std::cerr << "Warning: " << to_string(doc_class) << " chunking of '" << context.origin
              << "' failed (" << e.what() << "), falling back to fixed windows" << std::endl;
    spans.clear();
  }
  if (spans.empty()) {
    spans = fallback_->split(content, context);
  }

  merge_trailing_fragment(content, spans, doc_class);
  return build_chunks(content, spans, doc_class);
}

bool Chunker::starts_with_heading(std::string_view content, const Span& span) {
  const size_t newline = content.find('\n', span.start);
  const size_t line_end = newline == std::string_view::npos ? span.end : std::min(newline, span.end);
  return is_markdown_heading(content.substr(span.start, line_end - span.start));
}

void Chunker::merge_trailing_fragment(std::string_view content,
                                      std::vector<Span>& spans,
                                      DocumentClass doc_class) const {
  if (spans.size() < 2) {
    return;
  }
  const Span& last = spans.back();
  // A syntactic unit stands alone whatever its size
  if (last.doc_class.value_or(doc_class) == DocumentClass::Code &&
      !last.attributes.symbol_name.empty()) {
    return;
  }
  if (last.doc_class.value_or(doc_class) == DocumentClass::Markdown &&
      starts_with_heading(content, last)) {
    return;
  }
  const size_t own_start = std::max(last.start, spans[spans.size() - 2].end);
  const size_t tokens = own_start < last.end
                            ? estimate_tokens(content.substr(own_start, last.end - own_start))
                            : 0;
  if (tokens >= settings_.min_fragment_tokens) {
    return;
  }
  const size_t end = last.end;
  spans.pop_back();
  spans.back().end = end;
}

std::vector<Chunk> Chunker::build_chunks(std::string_view content,
                                         const std::vector<Span>& spans,
                                         DocumentClass doc_class) const {
  std::vector<size_t> line_starts{0};
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\n' && i + 1 < content.size()) {
      line_starts.push_back(i + 1);
    }
  }
  auto line_of = [&](size_t offset) {
    auto it = std::upper_bound(line_starts.begin(), line_starts.end(), offset);
    return static_cast<int>(it - line_starts.begin());
  };

  std::vector<Chunk> chunks;
  chunks.reserve(spans.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    const Span& span = spans[i];
    Chunk chunk;
    chunk.content = std::string(content.substr(span.start, span.end - span.start));
    chunk.chunk_index = static_cast<int>(i);
    chunk.start_offset = span.start;
    chunk.end_offset = span.end;
    chunk.overlap_bytes = i > 0 && span.start < spans[i - 1].end ? spans[i - 1].end - span.start : 0;
    chunk.token_count = static_cast<int>(estimate_tokens(chunk.content));
    chunk.doc_class = span.doc_class.value_or(doc_class);
    if (chunk.doc_class == DocumentClass::Mixed) {
      chunk.doc_class = DocumentClass::Text;
    }
    if (!span.language.empty()) {
      chunk.language = span.language;
    } else if (chunk.doc_class != DocumentClass::Code) {
      chunk.language = detect_natural_language(chunk.content);
    }
    chunk.attributes = span.attributes;
    chunk.attributes.line_start = line_of(span.start);
    chunk.attributes.line_end = line_of(span.end - 1);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

}  // namespace sift_core
