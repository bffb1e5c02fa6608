#include "sift_core/chunking/config_strategy.hpp"

#include <cctype>

#include "sift_core/classify/line_markers.hpp"

namespace sift_core {

namespace {

bool is_json(std::string_view content) {
  for (char c : content) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    return c == '{';
  }
  return false;
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return std::string(text.substr(begin, end - begin));
}

}  // namespace

bool ConfigStrategy::can_handle(DocumentClass doc_class) const {
  return doc_class == DocumentClass::Config;
}

std::vector<ConfigStrategy::Boundary> ConfigStrategy::json_boundaries(
    std::string_view content) const {
  std::vector<Boundary> boundaries;
  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  bool expecting_key = false;
  bool reading_key = false;
  size_t key_start = 0;

  for (size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
        if (reading_key) {
          reading_key = false;
          std::string key(content.substr(key_start + 1, i - key_start - 1));
          if (boundaries.empty()) {
            boundaries.push_back({0, key});
          } else {
            // Split at the start of the key's line when nothing else precedes it there
            size_t line_start = content.rfind('\n', key_start);
            line_start = line_start == std::string_view::npos ? 0 : line_start + 1;
            size_t position = key_start;
            if (trim(content.substr(line_start, key_start - line_start)).empty()) {
              position = line_start;
            }
            boundaries.push_back({position, key});
          }
        }
      }
      continue;
    }

    switch (c) {
      case '"':
        in_string = true;
        if (depth == 1 && expecting_key) {
          reading_key = true;
          key_start = i;
          expecting_key = false;
        }
        break;
      case '{':
      case '[':
        ++depth;
        if (depth == 1 && c == '{') {
          expecting_key = true;
        }
        break;
      case '}':
      case ']':
        --depth;
        if (depth < 0) {
          throw ChunkingError("Unbalanced JSON: unexpected closing bracket");
        }
        break;
      case ',':
        if (depth == 1) {
          expecting_key = true;
        }
        break;
      default:
        break;
    }
  }
  if (depth != 0 || in_string) {
    throw ChunkingError("Unbalanced JSON: document ends inside a value");
  }
  return boundaries;
}

std::vector<ConfigStrategy::Boundary> ConfigStrategy::line_boundaries(
    std::string_view content) const {
  std::vector<Boundary> boundaries;
  size_t comment_start = std::string_view::npos;

  for (const auto& line : split_lines(content, 0, content.size())) {
    std::string_view text = trim_line_ending(content.substr(line.start, line.end - line.start));
    if (is_blank_line(text)) {
      comment_start = std::string_view::npos;
      continue;
    }
    const char first = text.front();
    if (std::isspace(static_cast<unsigned char>(first))) {
      comment_start = std::string_view::npos;
      continue;
    }
    if (first == '#' || first == ';' || text.rfind("//", 0) == 0) {
      if (comment_start == std::string_view::npos) {
        comment_start = line.start;
      }
      continue;
    }
    // List items, closers and YAML document markers continue the current key
    if (first == '-' || first == ']' || first == '}' || text.rfind("...", 0) == 0) {
      comment_start = std::string_view::npos;
      continue;
    }

    std::string key;
    if (first == '[') {
      size_t close = text.find(']');
      key = trim(text.substr(1, close == std::string_view::npos ? text.size() - 1 : close - 1));
    } else {
      size_t sep = text.find_first_of(":=");
      key = trim(text.substr(0, sep == std::string_view::npos ? text.size() : sep));
      if (key.size() >= 2 && key.front() == '"' && key.back() == '"') {
        key = key.substr(1, key.size() - 2);
      }
    }
    size_t position = comment_start != std::string_view::npos ? comment_start : line.start;
    boundaries.push_back({position, key});
    comment_start = std::string_view::npos;
  }

  if (!boundaries.empty()) {
    boundaries.front().position = 0;
  }
  return boundaries;
}

std::vector<Span> ConfigStrategy::split(std::string_view content,
                                        const ChunkContext& /*context*/) const {
  std::vector<Boundary> boundaries =
      is_json(content) ? json_boundaries(content) : line_boundaries(content);
  if (boundaries.empty()) {
    boundaries.push_back({0, ""});
  }

  std::vector<Span> units;
  for (size_t i = 0; i < boundaries.size(); ++i) {
    size_t end = i + 1 < boundaries.size() ? boundaries[i + 1].position : content.size();
    if (end <= boundaries[i].position) {
      continue;
    }
    Span unit;
    unit.start = units.empty() ? 0 : boundaries[i].position;
    unit.end = end;
    unit.attributes.node_kind = "keys";
    unit.attributes.symbol_name = boundaries[i].key;
    units.push_back(std::move(unit));
  }
  return pack_units(content, units, settings_.config);
}

}  // namespace sift_core
