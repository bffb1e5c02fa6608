#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "sift_core/types/chunk.hpp"
#include "sift_core/types/document_class.hpp"

namespace sift_core {

inline constexpr const char* DEFAULT_KNOWLEDGE_BASE = "default";

struct DocumentRecord {
  int64_t id = 0;
  std::string origin;
  std::string knowledge_base = DEFAULT_KNOWLEDGE_BASE;
  std::string content_hash;
  DocumentClass doc_class = DocumentClass::Mixed;
  int current_version = 0;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct DocumentVersionRecord {
  int64_t document_id = 0;
  int version = 0;
  std::string content_hash;
  std::chrono::system_clock::time_point created_at;
};

// A chunk as persisted, with its text already decompressed.
struct StoredChunk {
  int64_t id = 0;
  int64_t document_id = 0;
  int version = 0;
  int chunk_index = 0;
  std::string origin;
  std::string content;
  size_t start_offset = 0;
  size_t end_offset = 0;
  int token_count = 0;
  DocumentClass doc_class = DocumentClass::Text;
  std::string language;
  ChunkAttributes attributes;
  bool is_deleted = false;
  std::chrono::system_clock::time_point created_at;
};

}  // namespace sift_core
