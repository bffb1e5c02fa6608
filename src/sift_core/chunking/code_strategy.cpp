#include "sift_core/chunking/code_strategy.hpp"

#include <iostream>

#include "sift_core/chunking/code/heuristic_code_parser.hpp"
#include "sift_core/chunking/code/tree_sitter_code_parser.hpp"
#include "sift_core/chunking/token_estimator.hpp"
#include "sift_core/classify/language_detector.hpp"

namespace sift_core {

CodeStrategy::CodeStrategy(const ChunkingSettings& settings) : ChunkingStrategy(settings) {
  parsers_.push_back(std::make_unique<TreeSitterCodeParser>(settings.grammar_dirs));
  parsers_.push_back(std::make_unique<HeuristicCodeParser>());
}

CodeStrategy::CodeStrategy(const ChunkingSettings& settings, std::vector<CodeParserPtr> parsers)
    : ChunkingStrategy(settings), parsers_(std::move(parsers)) {}

bool CodeStrategy::can_handle(DocumentClass doc_class) const {
  return doc_class == DocumentClass::Code;
}

std::vector<Span> CodeStrategy::split(std::string_view content,
                                      const ChunkContext& context) const {
  const std::string language = detect_programming_language(context.origin, content);

  if (!language.empty()) {
    for (const auto& parser : parsers_) {
      if (!parser->supports(language)) {
        continue;
      }
      std::optional<std::vector<CodeUnit>> units;
      try {
        units = parser->parse(content, language);
      } catch (const ChunkingError& e) {
        std::cerr << "Warning: Could not parse " << language << " source '" << context.origin
                  << "': " << e.what() << std::endl;
        continue;
      }
      if (!units) {
        continue;
      }
      if (!units->empty()) {
        return unit_spans(content, *units, language);
      }
      break;
    }
  }

  auto spans = fixed_windows(content, 0, content.size(), settings_.fixed.max_tokens,
                             settings_.fixed.overlap_tokens);
  for (auto& span : spans) {
    span.doc_class = DocumentClass::Code;
    span.language = language;
  }
  return spans;
}

std::vector<Span> CodeStrategy::unit_spans(std::string_view content,
                                           const std::vector<CodeUnit>& units,
                                           const std::string& language) const {
  std::vector<Span> spans;
  size_t previous_end = 0;
  for (size_t i = 0; i < units.size(); ++i) {
    const CodeUnit& unit = units[i];
    // Nested or out-of-order units are already covered by their predecessor
    if (unit.end <= previous_end || unit.end > content.size()) {
      continue;
    }
    const bool last = i + 1 == units.size();
    const size_t start = previous_end;
    const size_t end = last ? content.size() : unit.end;
    previous_end = end;

    ChunkAttributes attributes;
    attributes.node_kind = unit.kind;
    attributes.symbol_name = unit.name;

    const size_t tokens = estimate_tokens(content.substr(start, end - start));
    if (settings_.code.max_tokens > 0 && tokens > settings_.code.max_tokens) {
      auto windows = fixed_windows(content, start, end, settings_.code.max_tokens,
                                   settings_.code.overlap_tokens, attributes);
      for (auto& window : windows) {
        window.doc_class = DocumentClass::Code;
        window.language = language;
        spans.push_back(std::move(window));
      }
      continue;
    }

    Span span;
    span.start = start;
    span.end = end;
    span.attributes = std::move(attributes);
    span.doc_class = DocumentClass::Code;
    span.language = language;
    spans.push_back(std::move(span));
  }

  // Trailing text after the last accepted unit
  if (!spans.empty() && spans.back().end < content.size()) {
    spans.back().end = content.size();
  }
  return spans;
}

}  // namespace sift_core
