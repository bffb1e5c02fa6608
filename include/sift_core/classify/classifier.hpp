#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "sift_core/types/document_class.hpp"

namespace sift_core {

class Classifier {
 public:
  virtual ~Classifier() = default;

  // Total: returns Mixed when no class matches decisively. `sample` is a bounded prefix of the
  // raw content.
  virtual DocumentClass classify(std::string_view sample, const std::string &origin) const = 0;
};

using ClassifierPtr = std::shared_ptr<Classifier>;

}  // namespace sift_core
