#include "sift_core/classify/language_detector.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace sift_core {

namespace {

const std::unordered_map<std::string, std::string> &extension_languages() {
  static const std::unordered_map<std::string, std::string> map = {
      {".c", "c"},           {".h", "c"},          {".cc", "cpp"},        {".cpp", "cpp"},
      {".cxx", "cpp"},       {".hpp", "cpp"},      {".hh", "cpp"},        {".hxx", "cpp"},
      {".java", "java"},     {".js", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
      {".jsx", "javascript"}, {".ts", "typescript"}, {".tsx", "typescript"}, {".go", "go"},
      {".rs", "rust"},       {".cs", "csharp"},    {".kt", "kotlin"},     {".swift", "swift"},
      {".php", "php"},       {".scala", "scala"},  {".py", "python"},     {".rb", "ruby"},
      {".sh", "shell"},      {".bash", "shell"},   {".lua", "lua"},       {".sql", "sql"}};
  return map;
}

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

}  // namespace

std::string language_for_extension(const std::string &origin) {
  std::string extension = std::filesystem::path(origin).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = extension_languages().find(extension);
  if (it == extension_languages().end()) {
    return "";
  }
  return it->second;
}

std::string detect_programming_language(const std::string &origin, std::string_view content) {
  std::string by_extension = language_for_extension(origin);
  if (!by_extension.empty()) {
    return by_extension;
  }

  std::string_view head = content.substr(0, std::min<size_t>(content.size(), 4096));
  if (head.rfind("#!", 0) == 0) {
    std::string_view first_line = head.substr(0, head.find('\n'));
    if (contains(first_line, "python")) return "python";
    if (contains(first_line, "node")) return "javascript";
    if (contains(first_line, "sh")) return "shell";
  }
  if (contains(head, "#include <") || contains(head, "#include \"")) {
    return contains(head, "std::") || contains(head, "namespace ") || contains(head, "class ")
               ? "cpp"
               : "c";
  }
  if (contains(head, "package ") && contains(head, "func ")) return "go";
  if (contains(head, "fn ") && (contains(head, "let ") || contains(head, "impl "))) return "rust";
  if (contains(head, "public class ") || contains(head, "import java.")) return "java";
  if (contains(head, "def ") && contains(head, "):")) return "python";
  if (contains(head, "function ") || contains(head, "=> {") || contains(head, "const ")) {
    return contains(head, ": string") || contains(head, "interface ") ? "typescript"
                                                                       : "javascript";
  }
  return "";
}

std::string detect_natural_language(std::string_view text) {
  size_t latin = 0;
  size_t cyrillic = 0;
  auto it = text.begin();
  const auto end = text.end();
  while (it != end) {
    uint32_t cp = 0;
    try {
      cp = utf8::next(it, end);
    } catch (const utf8::exception &) {
      ++it;
      continue;
    }
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) {
      ++latin;
    } else if (cp >= 0x0400 && cp <= 0x04FF) {
      ++cyrillic;
    }
  }

  const size_t letters = latin + cyrillic;
  if (letters < 3) {
    return "und";
  }
  if (latin * 10 >= letters * 6) {
    return "en";
  }
  if (cyrillic * 10 >= letters * 6) {
    return "ru";
  }
  return "und";
}

}  // namespace sift_core
