#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sift_core/settings.hpp"
#include "sift_core/types/chunk.hpp"

namespace sift_core {

// Raised by a strategy that cannot chunk its input; the chunker falls back to fixed windows.
class ChunkingError : public std::exception {
 public:
  explicit ChunkingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Byte range [start, end) of the source. A span may start inside its predecessor (overlap) but
// never leaves a gap after it.
struct Span {
  size_t start = 0;
  size_t end = 0;
  ChunkAttributes attributes;
  std::optional<DocumentClass> doc_class;  // region class inside mixed documents
  std::string language;                    // programming language of code spans
  bool atomic = false;                     // never split, even when oversized
};

struct ChunkContext {
  std::string origin;
};

class ChunkingStrategy {
 public:
  explicit ChunkingStrategy(const ChunkingSettings& settings) : settings_(settings) {}
  virtual ~ChunkingStrategy() = default;

  virtual bool can_handle(DocumentClass doc_class) const = 0;

  // Spans covering [0, content.size()).
  virtual std::vector<Span> split(std::string_view content, const ChunkContext& context) const = 0;

 protected:
  ChunkingSettings settings_;

  /*
  Greedily packs contiguous units into spans of at most sizing.max_tokens. A unit that alone
  exceeds the maximum is cut into windows unless it is atomic.
  */
  std::vector<Span> pack_units(std::string_view content,
                               const std::vector<Span>& units,
                               const ChunkSizing& sizing) const;

  /**
   * @brief Implements the fixed-size chunking strategy over [start, end).
   *
   * Window ends land on UTF-8 boundaries and, when one is close enough, right after whitespace.
   * Each window after the first starts overlap_tokens before the previous end.
   */
  std::vector<Span> fixed_windows(std::string_view content,
                                  size_t start,
                                  size_t end,
                                  size_t window_tokens,
                                  size_t overlap_tokens,
                                  const ChunkAttributes& attributes = {}) const;

  // Moves each span's start back by roughly overlap_tokens, snapped to a word boundary.
  static void apply_token_overlap(std::string_view content,
                                  std::vector<Span>& spans,
                                  size_t overlap_tokens);
  // Moves each span's start back to the start of the last `lines` lines of its predecessor.
  static void apply_line_overlap(std::string_view content, std::vector<Span>& spans, size_t lines);

  static std::vector<Span> split_lines(std::string_view content, size_t start, size_t end);
  // Paragraphs end after a run of blank lines.
  static std::vector<Span> split_paragraphs(std::string_view content, size_t start, size_t end);
};

using ChunkingStrategyPtr = std::unique_ptr<ChunkingStrategy>;

}  // namespace sift_core
