#include "sift_core/types/chunk.hpp"

#include <nlohmann/json.hpp>

namespace sift_core {

std::string attributes_to_json(const ChunkAttributes& attributes) {
  nlohmann::json json = nlohmann::json::object();
  if (!attributes.node_kind.empty())
    json["node_kind"] = attributes.node_kind;
  if (!attributes.symbol_name.empty())
    json["symbol_name"] = attributes.symbol_name;
  if (!attributes.table_header.empty())
    json["table_header"] = attributes.table_header;
  if (attributes.line_start > 0) {
    json["line_start"] = attributes.line_start;
    json["line_end"] = attributes.line_end;
  }
  return json.dump();
}

ChunkAttributes attributes_from_json(const std::string& json_text) {
  ChunkAttributes attributes;
  if (json_text.empty()) {
    return attributes;
  }
  nlohmann::json json = nlohmann::json::parse(json_text, nullptr, /*allow_exceptions*/ false);
  if (!json.is_object()) {
    return attributes;
  }
  attributes.node_kind = json.value("node_kind", std::string());
  attributes.symbol_name = json.value("symbol_name", std::string());
  attributes.table_header = json.value("table_header", std::string());
  attributes.line_start = json.value("line_start", 0);
  attributes.line_end = json.value("line_end", 0);
  return attributes;
}

}  // namespace sift_core
