#include "sift_core/chunking/log_strategy.hpp"

#include "sift_core/classify/line_markers.hpp"

namespace sift_core {

bool LogStrategy::can_handle(DocumentClass doc_class) const {
  return doc_class == DocumentClass::Log;
}

std::vector<Span> LogStrategy::split(std::string_view content,
                                     const ChunkContext& /*context*/) const {
  auto lines = split_lines(content, 0, content.size());

  std::vector<Span> entries;
  for (const auto& line : lines) {
    std::string_view text = content.substr(line.start, line.end - line.start);
    if (entries.empty() || is_log_entry_start(text)) {
      Span entry;
      entry.start = line.start;
      entry.end = line.end;
      entry.attributes.node_kind = "entries";
      entries.push_back(std::move(entry));
    } else {
      entries.back().end = line.end;
    }
  }

  auto spans = pack_units(content, entries, settings_.log);
  apply_line_overlap(content, spans, settings_.log.overlap_units);
  return spans;
}

}  // namespace sift_core
