#pragma once

#include <optional>
#include <string>

#include "sift_core/types/document_class.hpp"

namespace sift_core {

// Everything the worker needs to ingest a submission; content travels compressed in the job row.
struct NewJobDTO {
  std::string knowledge_base;
  std::string origin;
  std::string content_hash;
  std::optional<DocumentClass> class_hint;
  std::string content;
};

}  // namespace sift_core
