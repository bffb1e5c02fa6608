#include "sift_core/services/document_service.hpp"

namespace sift_core {

DocumentService::DocumentService(std::shared_ptr<StorageService> storage)
    : storage_(std::move(storage)) {}

std::vector<DocumentRecord> DocumentService::list_documents(
    const std::optional<std::string>& knowledge_base) {
  return storage_->metadata().list_documents(knowledge_base);
}

DocumentDetails DocumentService::get_document(int64_t document_id) {
  auto document = storage_->metadata().get_document(document_id);
  if (!document) {
    throw NotFoundError("Document " + std::to_string(document_id) + " not found");
  }
  DocumentDetails details;
  details.document = *document;
  details.versions = storage_->metadata().list_versions(document_id);
  details.live_chunks =
      storage_->metadata().list_chunks(document_id, document->current_version).size();
  return details;
}

size_t DocumentService::remove_document(int64_t document_id) {
  return storage_->remove_document(document_id).size();
}

size_t DocumentService::remove_by_origin_prefix(const std::string& knowledge_base,
                                                const std::string& prefix) {
  if (prefix.empty()) {
    throw ValidationError("Origin prefix must not be empty");
  }
  return storage_->remove_by_origin_prefix(knowledge_base, prefix);
}

size_t DocumentService::purge_deleted(std::chrono::hours retention) {
  return storage_->purge_deleted(retention);
}

}  // namespace sift_core
