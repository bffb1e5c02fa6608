#pragma once

#include <optional>

#include "sift_core/classify/classifier.hpp"

namespace sift_core {

// Fraction of non-blank lines carrying each class's structural markers.
struct ClassScores {
  double text = 0.0;
  double code = 0.0;
  double table = 0.0;
  double markdown = 0.0;
  double config = 0.0;
  double log = 0.0;
  size_t lines = 0;
  size_t markdown_structure = 0;  // headings and fences
};

/*
Extension first, then line-level structural markers. One dominant score wins; two strong
competing signals, or none at all, give Mixed.
*/
class HeuristicClassifier : public Classifier {
 public:
  DocumentClass classify(std::string_view sample, const std::string &origin) const override;

  static std::optional<DocumentClass> class_for_extension(const std::string &origin);
  static ClassScores score(std::string_view sample);

  // Class of a single block inside mixed content. Never returns Mixed; blocks without a signal
  // are Text.
  static DocumentClass classify_block(std::string_view block);
};

}  // namespace sift_core
