#pragma once

#include <cstddef>
#include <string>

#include "sift_core/types/document_class.hpp"

namespace sift_core {

// Class-specific metadata attached to a chunk. Empty fields are omitted when serialized.
struct ChunkAttributes {
  std::string node_kind;     // "function_definition", "section", "rows", "window", ...
  std::string symbol_name;   // function/class name for code, heading for markdown, key for config
  std::string table_header;  // header row repeated for every table chunk
  int line_start = 0;        // 1-based, inclusive
  int line_end = 0;
};

std::string attributes_to_json(const ChunkAttributes& attributes);
ChunkAttributes attributes_from_json(const std::string& json_text);

// A contiguous span [start_offset, end_offset) of the source text. content is exactly that span;
// overlap_bytes counts the leading bytes shared with the previous chunk.
struct Chunk {
  std::string content;
  int chunk_index = 0;
  size_t start_offset = 0;
  size_t end_offset = 0;
  size_t overlap_bytes = 0;
  int token_count = 0;
  DocumentClass doc_class = DocumentClass::Text;
  std::string language;
  ChunkAttributes attributes;
};

}  // namespace sift_core
