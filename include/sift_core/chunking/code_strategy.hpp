#pragma once
#include <vector>

#include "sift_core/chunking/chunking_strategy.hpp"
#include "sift_core/chunking/code/code_parser.hpp"

namespace sift_core {

/*
One chunk per top-level syntactic unit. Parsers are tried in order for the detected language; the
first one that answers wins. Text between units attaches to the following unit and trailing text
to the last one. Without a parser for the language the source is cut into fixed windows.
*/
class CodeStrategy : public ChunkingStrategy {
 public:
  // Tree-sitter first, then the built-in heuristic parser.
  explicit CodeStrategy(const ChunkingSettings& settings);
  CodeStrategy(const ChunkingSettings& settings, std::vector<CodeParserPtr> parsers);

  bool can_handle(DocumentClass doc_class) const override;
  std::vector<Span> split(std::string_view content, const ChunkContext& context) const override;

 private:
  std::vector<Span> unit_spans(std::string_view content,
                               const std::vector<CodeUnit>& units,
                               const std::string& language) const;

  std::vector<CodeParserPtr> parsers_;
};

}  // namespace sift_core
