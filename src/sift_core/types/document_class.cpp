#include "sift_core/types/document_class.hpp"

#include <cctype>
#include <stdexcept>

namespace sift_core {

std::string to_string(DocumentClass doc_class) {
  switch (doc_class) {
    case DocumentClass::Text:
      return "text";
    case DocumentClass::Code:
      return "code";
    case DocumentClass::Table:
      return "table";
    case DocumentClass::Markdown:
      return "markdown";
    case DocumentClass::Config:
      return "config";
    case DocumentClass::Log:
      return "log";
    case DocumentClass::Mixed:
      return "mixed";
  }
  return "mixed";
}

DocumentClass document_class_from_string(const std::string& str) {
  for (DocumentClass doc_class : all_document_classes()) {
    if (to_string(doc_class) == str) {
      return doc_class;
    }
  }
  throw std::invalid_argument("Unknown DocumentClass: " + str);
}

std::optional<DocumentClass> try_parse_document_class(const std::string& str) {
  // First word that names a class wins, e.g. "Code." or "Answer: markdown"
  std::string word;
  auto match = [&]() -> std::optional<DocumentClass> {
    for (DocumentClass doc_class : all_document_classes()) {
      if (to_string(doc_class) == word) {
        return doc_class;
      }
    }
    return std::nullopt;
  };
  for (unsigned char c : str) {
    if (std::isalpha(c)) {
      word.push_back(static_cast<char>(std::tolower(c)));
      continue;
    }
    if (auto found = match()) {
      return found;
    }
    word.clear();
  }
  return match();
}

const std::vector<DocumentClass>& all_document_classes() {
  static const std::vector<DocumentClass> classes = {
      DocumentClass::Text,   DocumentClass::Code, DocumentClass::Table, DocumentClass::Markdown,
      DocumentClass::Config, DocumentClass::Log,  DocumentClass::Mixed};
  return classes;
}

}  // namespace sift_core
