#include "sift_core/chunking/mixed_strategy.hpp"

#include <iostream>

#include "sift_core/classify/heuristic_classifier.hpp"
#include "sift_core/classify/line_markers.hpp"

namespace sift_core {

MixedStrategy::MixedStrategy(const ChunkingSettings& settings,
                             std::vector<const ChunkingStrategy*> region_strategies)
    : ChunkingStrategy(settings), region_strategies_(std::move(region_strategies)) {}

bool MixedStrategy::can_handle(DocumentClass doc_class) const {
  return doc_class == DocumentClass::Mixed;
}

const ChunkingStrategy* MixedStrategy::strategy_for(DocumentClass doc_class) const {
  for (const auto* strategy : region_strategies_) {
    if (strategy->can_handle(doc_class)) {
      return strategy;
    }
  }
  return nullptr;
}

std::vector<MixedStrategy::Region> MixedStrategy::segment(std::string_view content) const {
  struct Block {
    size_t start;
    size_t end;
    bool fenced;
  };

  // Blank lines stay with the block before them; leading blank lines with the first block
  std::vector<Block> blocks;
  bool in_fence = false;
  bool in_block = false;
  bool leading_blank = false;
  for (const auto& line : split_lines(content, 0, content.size())) {
    std::string_view text = content.substr(line.start, line.end - line.start);
    const bool fence = is_fence_line(text);
    const bool blank = is_blank_line(text);

    if (!in_fence && !blank && !in_block) {
      if (blocks.empty() || leading_blank) {
        blocks.clear();
        blocks.push_back({0, line.end, fence});
      } else {
        blocks.push_back({line.start, line.end, fence});
      }
      in_block = true;
      leading_blank = false;
    } else if (blocks.empty()) {
      blocks.push_back({0, line.end, false});
      leading_blank = true;
    } else {
      blocks.back().end = line.end;
      blocks.back().fenced = blocks.back().fenced || fence;
    }

    if (fence) {
      in_fence = !in_fence;
    }
    if (blank && !in_fence) {
      in_block = false;
    }
  }

  std::vector<Region> regions;
  for (const auto& block : blocks) {
    DocumentClass block_class =
        block.fenced ? DocumentClass::Markdown
                     : HeuristicClassifier::classify_block(
                           content.substr(block.start, block.end - block.start));
    if (!regions.empty()) {
      Region& previous = regions.back();
      const bool same = previous.doc_class == block_class;
      const bool prose_in_markdown =
          previous.doc_class == DocumentClass::Markdown && block_class == DocumentClass::Text;
      if (same || prose_in_markdown) {
        previous.end = block.end;
        continue;
      }
    }
    regions.push_back({block.start, block.end, block_class});
  }
  if (!regions.empty()) {
    regions.back().end = content.size();
  }
  return regions;
}

std::vector<Span> MixedStrategy::split(std::string_view content,
                                       const ChunkContext& /*context*/) const {
  std::vector<Span> spans;
  // Regions carry no origin of their own; code language is sniffed from the text
  const ChunkContext region_context;

  for (const auto& region : segment(content)) {
    std::string_view region_text = content.substr(region.start, region.end - region.start);
    std::vector<Span> region_spans;
    const ChunkingStrategy* strategy = strategy_for(region.doc_class);
    try {
      if (!strategy) {
        throw ChunkingError("No strategy for " + to_string(region.doc_class) + " region");
      }
      region_spans = strategy->split(region_text, region_context);
    } catch (const ChunkingError& e) {
      std::cerr << "Warning: " << to_string(region.doc_class) << " region at offset "
                << region.start << " falls back to fixed windows: " << e.what() << std::endl;
      region_spans = fixed_windows(region_text, 0, region_text.size(), settings_.fixed.max_tokens,
                                   settings_.fixed.overlap_tokens);
    }

    for (auto& span : region_spans) {
      span.start += region.start;
      span.end += region.start;
      if (!span.doc_class) {
        span.doc_class = region.doc_class;
      }
      spans.push_back(std::move(span));
    }
  }
  return spans;
}

}  // namespace sift_core
