#include "sift_core/chunking/table_strategy.hpp"

#include "sift_core/classify/line_markers.hpp"

namespace sift_core {

bool TableStrategy::can_handle(DocumentClass doc_class) const {
  return doc_class == DocumentClass::Table;
}

std::vector<Span> TableStrategy::split(std::string_view content,
                                       const ChunkContext& /*context*/) const {
  auto lines = split_lines(content, 0, content.size());

  // Leading blank lines travel with the header row
  std::string header;
  std::vector<Span> rows;
  bool header_found = false;
  for (const auto& line : lines) {
    std::string_view text = content.substr(line.start, line.end - line.start);
    if (!header_found) {
      if (is_blank_line(text)) {
        continue;
      }
      header_found = true;
      header = std::string(trim_line_ending(text));
      Span row;
      row.start = 0;
      row.end = line.end;
      rows.push_back(std::move(row));
      continue;
    }
    rows.push_back(line);
  }
  if (rows.empty()) {
    throw ChunkingError("Table has no rows");
  }

  for (auto& row : rows) {
    row.attributes.node_kind = "rows";
    row.attributes.table_header = header;
  }
  auto spans = pack_units(content, rows, settings_.table);
  apply_line_overlap(content, spans, settings_.table.overlap_units);
  return spans;
}

}  // namespace sift_core
