#include "sift_core/chunking/code/heuristic_code_parser.hpp"

#include <cctype>
#include <regex>
#include <unordered_set>

#include "sift_core/chunking/chunking_strategy.hpp"
#include "sift_core/classify/line_markers.hpp"

namespace sift_core {

namespace {

const std::unordered_set<std::string>& brace_languages() {
  static const std::unordered_set<std::string> languages = {
      "c",    "cpp",  "java",  "csharp", "javascript", "typescript",
      "go",   "rust", "kotlin", "swift", "php",        "scala"};
  return languages;
}

bool quotes_are_strings(const std::string& language) {
  return language == "javascript" || language == "typescript" || language == "php";
}

bool has_backtick_strings(const std::string& language) {
  return language == "javascript" || language == "typescript" || language == "go";
}

bool is_identifier_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == ':' ||
         c == '~';
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return std::string(text.substr(begin, end - begin));
}

struct Line {
  size_t start;
  size_t end;
};

std::vector<Line> lines_of(std::string_view content) {
  std::vector<Line> lines;
  size_t pos = 0;
  while (pos < content.size()) {
    size_t nl = content.find('\n', pos);
    size_t end = nl == std::string_view::npos ? content.size() : nl + 1;
    lines.push_back({pos, end});
    pos = end;
  }
  return lines;
}

bool has_preprocessor(const std::string& language) {
  return language == "c" || language == "cpp" || language == "csharp";
}

struct HeaderInfo {
  bool transparent = false;
  std::string name;
  std::string kind;
};

// Identifier preceding the first call-like '(' that is not a control keyword.
std::string function_name(const std::string& header) {
  static const std::unordered_set<std::string> keywords = {
      "if", "for", "while", "switch", "catch", "function", "func", "fn", "return", "sizeof"};
  for (size_t paren = header.find('('); paren != std::string::npos;
       paren = header.find('(', paren + 1)) {
    size_t end = paren;
    while (end > 0 && std::isspace(static_cast<unsigned char>(header[end - 1]))) {
      --end;
    }
    // Generic parameters: foo<T>(
    if (end > 0 && header[end - 1] == '>') {
      int depth = 0;
      while (end > 0) {
        char c = header[end - 1];
        if (c == '>') ++depth;
        if (c == '<') --depth;
        --end;
        if (depth == 0) break;
      }
    }
    size_t begin = end;
    while (begin > 0 && is_identifier_char(header[begin - 1])) {
      --begin;
    }
    std::string candidate = header.substr(begin, end - begin);
    while (!candidate.empty() && candidate.front() == ':') {
      candidate.erase(0, 1);
    }
    if (!candidate.empty() && !keywords.count(candidate) &&
        !std::isdigit(static_cast<unsigned char>(candidate.front()))) {
      return candidate;
    }
  }
  return "";
}

HeaderInfo classify_header(const std::string& header) {
  static const std::regex transparent_regex(
      R"(^(export\s+)?(namespace|package|module|mod)\b|^extern\s*"C(\+\+)?"\s*$)");
  static const std::regex type_regex(
      R"(\b(class|struct|interface|enum|trait|impl|union|record|object|protocol|extension)\s*(?:<[^>]*>\s*)?(?:class\s+|struct\s+)?([A-Za-z_]\w*))");
  static const std::regex variable_regex(R"(\b(?:const|let|var|val)\s+([A-Za-z_$][\w$]*))");

  HeaderInfo info;
  const std::string trimmed = trim(header);
  if (std::regex_search(trimmed, transparent_regex)) {
    info.transparent = true;
    return info;
  }

  const bool has_paren = trimmed.find('(') != std::string::npos;
  std::smatch match;
  if (std::regex_search(trimmed, match, type_regex)) {
    const std::string keyword = match[1].str();
    const bool declaration_only = keyword == "struct" || keyword == "enum" || keyword == "union";
    if (!declaration_only || !has_paren) {
      info.kind = keyword;
      info.name = match[2].str();
      return info;
    }
  }

  if (has_paren) {
    info.kind = "function";
    info.name = function_name(trimmed);
    if (!info.name.empty()) {
      return info;
    }
  }
  if (std::regex_search(trimmed, match, variable_regex)) {
    info.kind = has_paren ? "function" : "block";
    info.name = match[1].str();
    return info;
  }
  info.kind = has_paren ? "function" : "block";
  return info;
}

}  // namespace

bool HeuristicCodeParser::supports(const std::string& language) const {
  return language == "python" || brace_languages().count(language) > 0;
}

std::optional<std::vector<CodeUnit>> HeuristicCodeParser::parse(std::string_view content,
                                                                const std::string& language) const {
  if (language == "python") {
    return parse_indentation(content);
  }
  if (brace_languages().count(language)) {
    return parse_braces(content, language);
  }
  return std::nullopt;
}

std::vector<CodeUnit> HeuristicCodeParser::parse_braces(std::string_view content,
                                                        const std::string& language) const {
  enum class Frame { Transparent, Unit, Inner };
  std::vector<Frame> stack;
  std::vector<CodeUnit> units;
  CodeUnit open_unit;
  size_t statement_start = std::string_view::npos;
  const bool single_quote_strings = quotes_are_strings(language);
  const bool backticks = has_backtick_strings(language);

  auto at_top_level = [&]() {
    for (Frame frame : stack) {
      if (frame != Frame::Transparent) return false;
    }
    return true;
  };

  auto skip_quoted = [&](size_t i, char quote) {
    for (size_t j = i + 1; j < content.size(); ++j) {
      if (content[j] == '\\') {
        ++j;
        continue;
      }
      if (content[j] == quote) {
        return j;
      }
      if (content[j] == '\n' && quote != '`') {
        break;
      }
    }
    throw ChunkingError("Unterminated string literal at offset " + std::to_string(i));
  };

  for (size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    const char next = i + 1 < content.size() ? content[i + 1] : '\0';

    // Comments
    if (c == '/' && next == '/') {
      size_t nl = content.find('\n', i);
      i = nl == std::string_view::npos ? content.size() : nl;
      continue;
    }
    if (c == '/' && next == '*') {
      size_t close = content.find("*/", i + 2);
      if (close == std::string_view::npos) {
        throw ChunkingError("Unterminated block comment at offset " + std::to_string(i));
      }
      i = close + 1;
      continue;
    }
    if (c == '#' && language == "php") {
      size_t nl = content.find('\n', i);
      i = nl == std::string_view::npos ? content.size() : nl;
      continue;
    }

    const bool top = at_top_level();

    // Preprocessor directives, including continuation lines
    if (c == '#' && top && has_preprocessor(language) &&
        (i == 0 || content.find_last_not_of(" \t", i - 1) == std::string_view::npos ||
         content[content.find_last_not_of(" \t", i - 1)] == '\n')) {
      size_t j = i;
      while (j < content.size() && content[j] != '\n') {
        if (content[j] == '\\' && j + 1 < content.size() && content[j + 1] == '\n') ++j;
        ++j;
      }
      i = j;
      statement_start = std::string_view::npos;
      continue;
    }
    if (top && statement_start == std::string_view::npos &&
        !std::isspace(static_cast<unsigned char>(c))) {
      statement_start = i;
    }

    // Literals
    if (c == '"' || (c == '`' && backticks)) {
      i = skip_quoted(i, c);
      continue;
    }
    if (c == '\'') {
      if (single_quote_strings) {
        i = skip_quoted(i, c);
      } else if (next == '\\') {
        size_t close = content.find('\'', i + 2);
        if (close == std::string_view::npos) {
          throw ChunkingError("Unterminated character literal at offset " + std::to_string(i));
        }
        i = close;
      } else if (i + 2 < content.size() && content[i + 2] == '\'') {
        i += 2;
      }
      // Otherwise a lifetime or digit separator
      continue;
    }

    if (top) {
      if (c == ';') {
        statement_start = std::string_view::npos;
      } else if (c == '{') {
        size_t header_start = statement_start == std::string_view::npos ? i : statement_start;
        HeaderInfo info =
            classify_header(std::string(content.substr(header_start, i - header_start)));
        if (info.transparent) {
          stack.push_back(Frame::Transparent);
        } else {
          stack.push_back(Frame::Unit);
          open_unit = CodeUnit{header_start, 0, info.name, info.kind};
        }
        statement_start = std::string_view::npos;
      } else if (c == '}') {
        if (stack.empty()) {
          throw ChunkingError("Unbalanced braces: unexpected '}' at offset " + std::to_string(i));
        }
        stack.pop_back();
        statement_start = std::string_view::npos;
      }
      continue;
    }

    if (c == '{') {
      stack.push_back(Frame::Inner);
    } else if (c == '}') {
      Frame frame = stack.back();
      stack.pop_back();
      if (frame == Frame::Unit) {
        size_t end = i + 1;
        size_t j = end;
        while (j < content.size() && (content[j] == ' ' || content[j] == '\t')) ++j;
        if (j < content.size() && content[j] == ';') {
          end = j + 1;
        }
        open_unit.end = end;
        units.push_back(open_unit);
        i = end - 1;
        statement_start = std::string_view::npos;
      }
    }
  }

  if (!stack.empty()) {
    throw ChunkingError("Unbalanced braces: " + std::to_string(stack.size()) +
                        " block(s) left open at end of file");
  }
  return units;
}

std::vector<CodeUnit> HeuristicCodeParser::parse_indentation(std::string_view content) const {
  static const std::regex def_regex(R"(^(?:async\s+)?(def|class)\s+([A-Za-z_]\w*))");

  std::vector<Line> lines = lines_of(content);
  std::vector<CodeUnit> units;
  size_t decorator_start = std::string_view::npos;

  size_t i = 0;
  while (i < lines.size()) {
    std::string_view text = content.substr(lines[i].start, lines[i].end - lines[i].start);
    const bool indented = !text.empty() && (text[0] == ' ' || text[0] == '\t');

    if (is_blank_line(text) || indented) {
      ++i;
      continue;
    }
    if (text[0] == '@') {
      if (decorator_start == std::string_view::npos) {
        decorator_start = lines[i].start;
      }
      ++i;
      continue;
    }

    std::cmatch match;
    std::string_view trimmed = trim_line_ending(text);
    if (!std::regex_search(trimmed.data(), trimmed.data() + trimmed.size(), match, def_regex)) {
      decorator_start = std::string_view::npos;
      ++i;
      continue;
    }

    CodeUnit unit;
    unit.start = decorator_start != std::string_view::npos ? decorator_start : lines[i].start;
    unit.kind = match[1].str() == "def" ? "function" : "class";
    unit.name = match[2].str();
    decorator_start = std::string_view::npos;

    // Signature lines until the parentheses close
    int paren_depth = 0;
    size_t last = i;
    for (;;) {
      std::string_view line = content.substr(lines[last].start, lines[last].end - lines[last].start);
      for (char c : line) {
        if (c == '(' || c == '[') ++paren_depth;
        if (c == ')' || c == ']') --paren_depth;
      }
      if (paren_depth <= 0 || last + 1 >= lines.size()) break;
      ++last;
    }

    // Body: indented or blank lines
    size_t body_end = last;
    size_t j = last + 1;
    while (j < lines.size()) {
      std::string_view line = content.substr(lines[j].start, lines[j].end - lines[j].start);
      if (is_blank_line(line)) {
        ++j;
        continue;
      }
      if (line[0] == ' ' || line[0] == '\t') {
        body_end = j;
        ++j;
        continue;
      }
      break;
    }
    unit.end = lines[body_end].end;
    units.push_back(std::move(unit));
    i = body_end + 1;
  }
  return units;
}

}  // namespace sift_core
