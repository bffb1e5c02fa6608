#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sift_core {

// Content-type label that selects the chunking strategy.
enum class DocumentClass { Text, Code, Table, Markdown, Config, Log, Mixed };

std::string to_string(DocumentClass doc_class);

// Throws std::invalid_argument on unknown labels.
DocumentClass document_class_from_string(const std::string& str);

// Lenient parse for provider output: case-insensitive, surrounding punctuation ignored.
std::optional<DocumentClass> try_parse_document_class(const std::string& str);

const std::vector<DocumentClass>& all_document_classes();

}  // namespace sift_core
