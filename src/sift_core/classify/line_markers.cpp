#include "sift_core/classify/line_markers.hpp"

#include <cctype>
#include <regex>

namespace sift_core {

namespace {

size_t leading_spaces(std::string_view line) {
  size_t i = 0;
  while (i < line.size() && line[i] == ' ') {
    ++i;
  }
  return i;
}

bool search(std::string_view line, const std::regex &re) {
  return std::regex_search(line.begin(), line.end(), re);
}

}  // namespace

std::string_view trim_line_ending(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  return line;
}

bool is_blank_line(std::string_view line) {
  for (char c : line) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool is_markdown_heading(std::string_view line) {
  line = trim_line_ending(line);
  size_t i = leading_spaces(line);
  if (i > 3) {
    return false;
  }
  size_t hashes = 0;
  while (i < line.size() && line[i] == '#') {
    ++hashes;
    ++i;
  }
  if (hashes == 0 || hashes > 6) {
    return false;
  }
  return i == line.size() || line[i] == ' ' || line[i] == '\t';
}

std::string markdown_heading_text(std::string_view line) {
  line = trim_line_ending(line);
  size_t i = leading_spaces(line);
  while (i < line.size() && line[i] == '#') {
    ++i;
  }
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
    ++i;
  }
  size_t end = line.size();
  // Closing sequence: "## Title ##"
  while (end > i && (line[end - 1] == '#' || line[end - 1] == ' ' || line[end - 1] == '\t')) {
    --end;
  }
  return std::string(line.substr(i, end - i));
}

bool is_fence_line(std::string_view line) {
  size_t i = leading_spaces(line);
  if (i > 3) {
    return false;
  }
  line.remove_prefix(i);
  return line.rfind("```", 0) == 0 || line.rfind("~~~", 0) == 0;
}

bool is_markdown_list_item(std::string_view line) {
  static const std::regex list_regex(R"(^\s{0,3}([-*+]|\d{1,3}[.)])\s+\S)");
  return search(line, list_regex);
}

bool is_log_entry_start(std::string_view line) {
  static const std::regex log_regex(
      R"(^(\[?\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}|\[?\d{2}:\d{2}:\d{2}|[A-Z][a-z]{2} +\d{1,2} \d{2}:\d{2}:\d{2}|\[?(TRACE|DEBUG|INFO|WARN|WARNING|ERROR|FATAL|CRITICAL)\b))");
  return search(line.substr(0, 64), log_regex);
}

bool is_code_line(std::string_view line) {
  static const std::regex keyword_regex(
      R"(^\s*(def |class |struct |fn |func |function |import |from \S+ import|#include|package |public |private |protected |static |const |let |var |return\b|if\s*\(|for\s*\(|while\s*\(|namespace |template\s*<|using |impl |pub |async def ))");
  std::string_view trimmed = trim_line_ending(line);
  while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) {
    trimmed.remove_suffix(1);
  }
  if (trimmed.empty()) {
    return false;
  }
  const char last = trimmed.back();
  if (last == ';' || last == '{' || last == '}') {
    return true;
  }
  return search(trimmed, keyword_regex);
}

bool is_key_value_line(std::string_view line) {
  static const std::regex kv_regex(R"(^\s*"?[A-Za-z_][A-Za-z0-9_.\-]{0,63}"?\s*(:|=)(\s|$))");
  static const std::regex section_regex(R"(^\s*\[[A-Za-z0-9_.\- ]+\]\s*$)");
  std::string_view trimmed = trim_line_ending(line);
  return search(trimmed, kv_regex) || search(trimmed, section_regex);
}

bool is_prose_line(std::string_view line) {
  std::string_view trimmed = trim_line_ending(line);
  size_t words = 0;
  size_t letters = 0;
  size_t non_space = 0;
  bool in_word = false;
  for (char c : trimmed) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      in_word = false;
      continue;
    }
    ++non_space;
    // Bytes >= 0x80 belong to non-ASCII letters
    if (std::isalpha(uc) || uc >= 0x80) {
      ++letters;
    }
    if (!in_word) {
      ++words;
      in_word = true;
    }
  }
  return words >= 6 && non_space > 0 && letters * 10 >= non_space * 8;
}

}  // namespace sift_core
