#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sift_core {

// A top-level syntactic unit: function, class, method, struct...
struct CodeUnit {
  size_t start = 0;
  size_t end = 0;
  std::string name;
  std::string kind;
};

class CodeParser {
 public:
  virtual ~CodeParser() = default;

  virtual std::string name() const = 0;
  virtual bool supports(const std::string& language) const = 0;

  // Sorted, non-overlapping top-level units. nullopt when this parser cannot handle the input;
  // throws ChunkingError when the source is structurally broken.
  virtual std::optional<std::vector<CodeUnit>> parse(std::string_view content,
                                                     const std::string& language) const = 0;
};

using CodeParserPtr = std::unique_ptr<CodeParser>;

}  // namespace sift_core
