#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sift_core/chunking/code/code_parser.hpp"

struct TSLanguage;
struct TSNode;

namespace sift_core {

/*
Structural parser backed by tree-sitter grammars loaded at runtime. A grammar is looked up as
libtree-sitter-<lang>.so in the configured directories, then $SIFT_TS_GRAMMAR_DIR, then the system
library path. Languages without a loadable grammar, and sources that do not parse cleanly, are left
to the next parser.
*/
class TreeSitterCodeParser : public CodeParser {
 public:
  explicit TreeSitterCodeParser(std::vector<std::string> grammar_dirs = {});
  ~TreeSitterCodeParser() override;

  TreeSitterCodeParser(const TreeSitterCodeParser&) = delete;
  TreeSitterCodeParser& operator=(const TreeSitterCodeParser&) = delete;

  std::string name() const override {
    return "tree-sitter";
  }
  bool supports(const std::string& language) const override;
  std::optional<std::vector<CodeUnit>> parse(std::string_view content,
                                             const std::string& language) const override;

 private:
  struct Grammar {
    void* handle = nullptr;
    const TSLanguage* language = nullptr;
  };

  // Cached per language; a failed load is cached too.
  const TSLanguage* load_grammar(const std::string& language) const;
  std::vector<std::string> library_candidates(const std::string& language) const;

  std::vector<std::string> grammar_dirs_;
  mutable std::mutex mutex_;
  mutable std::unordered_map<std::string, Grammar> grammars_;
};

}  // namespace sift_core
