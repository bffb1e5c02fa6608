#pragma once
#include <vector>

#include "sift_core/chunking/chunking_strategy.hpp"

namespace sift_core {

/*
Segments content into homogeneous regions before chunking. Blocks are separated by blank lines
(never inside a fence) and classified one by one; neighbouring blocks of the same class form a
region, and prose following markdown stays with it. Each region is chunked by the strategy of its
own class.
*/
class MixedStrategy : public ChunkingStrategy {
 public:
  struct Region {
    size_t start;
    size_t end;
    DocumentClass doc_class;
  };

  // region_strategies are borrowed and must outlive this strategy.
  MixedStrategy(const ChunkingSettings& settings,
                std::vector<const ChunkingStrategy*> region_strategies);

  bool can_handle(DocumentClass doc_class) const override;
  std::vector<Span> split(std::string_view content, const ChunkContext& context) const override;

  std::vector<Region> segment(std::string_view content) const;

 private:
  const ChunkingStrategy* strategy_for(DocumentClass doc_class) const;

  std::vector<const ChunkingStrategy*> region_strategies_;
};

}  // namespace sift_core
