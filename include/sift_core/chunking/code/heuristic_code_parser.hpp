#pragma once
#include "sift_core/chunking/code/code_parser.hpp"

namespace sift_core {

/*
Built-in structural parser for the common language families: brace languages (C, C++, Java, C#,
JavaScript, TypeScript, Go, Rust, Kotlin, Swift, PHP, Scala) and indentation languages (Python).
Namespaces, packages and extern blocks are transparent: their members are top-level units.
*/
class HeuristicCodeParser : public CodeParser {
 public:
  std::string name() const override {
    return "heuristic";
  }
  bool supports(const std::string& language) const override;
  std::optional<std::vector<CodeUnit>> parse(std::string_view content,
                                             const std::string& language) const override;

 private:
  std::vector<CodeUnit> parse_braces(std::string_view content, const std::string& language) const;
  std::vector<CodeUnit> parse_indentation(std::string_view content) const;
};

}  // namespace sift_core
