#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/services/storage_service.hpp"
#include "sift_core/types/document.hpp"

namespace sift_core {

struct DocumentDetails {
  DocumentRecord document;
  std::vector<DocumentVersionRecord> versions;
  size_t live_chunks = 0;
};

// Listing and removal of stored documents.
class DocumentService {
 public:
  explicit DocumentService(std::shared_ptr<StorageService> storage);

  std::vector<DocumentRecord> list_documents(
      const std::optional<std::string>& knowledge_base = std::nullopt);

  // Throws NotFoundError for unknown ids.
  DocumentDetails get_document(int64_t document_id);

  // Removes the document with its versions, chunks and vectors. Returns the removed chunk count.
  size_t remove_document(int64_t document_id);
  // Removes every document of the knowledge base whose origin starts with prefix. Returns how many.
  size_t remove_by_origin_prefix(const std::string& knowledge_base, const std::string& prefix);

  size_t purge_deleted(std::chrono::hours retention);

 private:
  std::shared_ptr<StorageService> storage_;
};

}  // namespace sift_core
