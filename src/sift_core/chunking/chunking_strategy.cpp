#include "sift_core/chunking/chunking_strategy.hpp"

#include <cctype>
#include <regex>

#include "sift_core/chunking/token_estimator.hpp"

namespace sift_core {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Start of the line that ends at pos (pos is just past its newline, or the region end).
size_t line_start_before(std::string_view content, size_t pos, size_t floor) {
  size_t q = pos;
  if (q > floor && content[q - 1] == '\n') {
    --q;
  }
  while (q > floor && content[q - 1] != '\n') {
    --q;
  }
  return q;
}

}  // namespace

std::vector<Span> ChunkingStrategy::pack_units(std::string_view content,
                                               const std::vector<Span>& units,
                                               const ChunkSizing& sizing) const {
  std::vector<Span> out;
  std::optional<Span> current;
  size_t current_tokens = 0;

  auto flush = [&]() {
    if (current) {
      out.push_back(std::move(*current));
      current.reset();
      current_tokens = 0;
    }
  };

  for (const auto& unit : units) {
    if (unit.end <= unit.start) {
      continue;
    }
    const size_t tokens = estimate_tokens(content.substr(unit.start, unit.end - unit.start));

    if (tokens > sizing.max_tokens && !unit.atomic) {
      flush();
      auto windows = fixed_windows(content, unit.start, unit.end, sizing.max_tokens,
                                   sizing.overlap_tokens, unit.attributes);
      out.insert(out.end(), windows.begin(), windows.end());
      continue;
    }

    if (current && current_tokens + tokens > sizing.max_tokens) {
      flush();
    }
    if (!current) {
      current = unit;
      current->atomic = false;
    } else {
      current->end = unit.end;
    }
    current_tokens += tokens;
  }
  flush();
  return out;
}

std::vector<Span> ChunkingStrategy::fixed_windows(std::string_view content,
                                                  size_t start,
                                                  size_t end,
                                                  size_t window_tokens,
                                                  size_t overlap_tokens,
                                                  const ChunkAttributes& attributes) const {
  std::vector<Span> out;
  if (window_tokens == 0) {
    window_tokens = settings_.fixed.max_tokens;
  }
  if (overlap_tokens >= window_tokens) {
    overlap_tokens = window_tokens / 4;
  }

  size_t pos = start;
  while (pos < end) {
    size_t window_end = advance_by_tokens(content, pos, window_tokens, end);
    if (window_end < end) {
      // Prefer to end right after whitespace within the last quarter of the window
      const size_t min_end = pos + (window_end - pos) * 3 / 4;
      size_t ws = window_end;
      while (ws > min_end && !is_space(content[ws - 1])) {
        --ws;
      }
      if (ws > min_end) {
        window_end = ws;
      }
    }

    Span span;
    span.start = pos;
    span.end = window_end;
    span.attributes = attributes;
    if (span.attributes.node_kind.empty()) {
      span.attributes.node_kind = "window";
    }
    out.push_back(std::move(span));

    if (window_end >= end) {
      break;
    }

    size_t next = window_end;
    if (overlap_tokens > 0) {
      next = retreat_by_tokens(content, window_end, overlap_tokens, pos);
      size_t snapped = next;
      while (snapped < window_end && snapped > 0 && !is_space(content[snapped - 1])) {
        ++snapped;
      }
      if (snapped < window_end) {
        next = snapped;
      }
    }
    if (next <= pos) {
      next = window_end;
    }
    pos = next;
  }
  return out;
}

void ChunkingStrategy::apply_token_overlap(std::string_view content,
                                           std::vector<Span>& spans,
                                           size_t overlap_tokens) {
  if (overlap_tokens == 0) {
    return;
  }
  for (size_t i = 1; i < spans.size(); ++i) {
    const Span& prev = spans[i - 1];
    if (spans[i].start != prev.end) {
      continue;
    }
    size_t start = retreat_by_tokens(content, prev.end, overlap_tokens, prev.start);
    size_t snapped = start;
    while (snapped < prev.end && snapped > 0 && !is_space(content[snapped - 1])) {
      ++snapped;
    }
    if (snapped < prev.end) {
      start = snapped;
    }
    if (start > prev.start && start < spans[i].start) {
      spans[i].start = start;
    }
  }
}

void ChunkingStrategy::apply_line_overlap(std::string_view content,
                                          std::vector<Span>& spans,
                                          size_t lines) {
  if (lines == 0) {
    return;
  }
  for (size_t i = 1; i < spans.size(); ++i) {
    const Span& prev = spans[i - 1];
    if (spans[i].start != prev.end) {
      continue;
    }
    size_t start = prev.end;
    for (size_t n = 0; n < lines && start > prev.start; ++n) {
      start = line_start_before(content, start, prev.start);
    }
    if (start > prev.start && start < spans[i].start) {
      spans[i].start = start;
    }
  }
}

std::vector<Span> ChunkingStrategy::split_lines(std::string_view content, size_t start, size_t end) {
  std::vector<Span> lines;
  size_t pos = start;
  while (pos < end) {
    size_t nl = content.find('\n', pos);
    size_t line_end = (nl == std::string_view::npos || nl >= end) ? end : nl + 1;
    Span line;
    line.start = pos;
    line.end = line_end;
    lines.push_back(std::move(line));
    pos = line_end;
  }
  return lines;
}

std::vector<Span> ChunkingStrategy::split_paragraphs(std::string_view content,
                                                     size_t start,
                                                     size_t end) {
  // One or more blank lines act as paragraph separators
  static const std::regex paragraph_regex(R"(\n[ \t\r]*\n\s*)");

  std::vector<size_t> split_points;
  split_points.push_back(start);
  const char* base = content.data();
  auto sections_begin = std::cregex_iterator(base + start, base + end, paragraph_regex);
  auto sections_end = std::cregex_iterator();
  for (auto i = sections_begin; i != sections_end; ++i) {
    // Split *after* the blank lines
    size_t split_pos = start + i->position() + i->length();
    if (split_pos < end) {
      split_points.push_back(split_pos);
    }
  }
  split_points.push_back(end);

  std::vector<Span> paragraphs;
  for (size_t i = 0; i + 1 < split_points.size(); ++i) {
    if (split_points[i + 1] <= split_points[i]) {
      continue;
    }
    Span paragraph;
    paragraph.start = split_points[i];
    paragraph.end = split_points[i + 1];
    paragraphs.push_back(std::move(paragraph));
  }
  return paragraphs;
}

}  // namespace sift_core
