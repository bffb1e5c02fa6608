#include "sift_core/chunking/code/tree_sitter_code_parser.hpp"

#include <dlfcn.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unordered_set>

extern "C" {
#include <tree_sitter/api.h>
}

namespace sift_core {

namespace {

struct GrammarSpec {
  const char* language;
  const char* library;  // core name, without lib prefix and .so suffix
  const char* symbol;
};

constexpr GrammarSpec kSpecs[] = {
    {"c", "tree-sitter-c", "tree_sitter_c"},
    {"cpp", "tree-sitter-cpp", "tree_sitter_cpp"},
    {"python", "tree-sitter-python", "tree_sitter_python"},
    {"go", "tree-sitter-go", "tree_sitter_go"},
    {"rust", "tree-sitter-rust", "tree_sitter_rust"},
    {"javascript", "tree-sitter-javascript", "tree_sitter_javascript"},
    {"typescript", "tree-sitter-typescript", "tree_sitter_typescript"},
    {"java", "tree-sitter-java", "tree_sitter_java"},
    {"csharp", "tree-sitter-c-sharp", "tree_sitter_c_sharp"},
};

const GrammarSpec* find_spec(const std::string& language) {
  for (const auto& spec : kSpecs) {
    if (language == spec.language) {
      return &spec;
    }
  }
  return nullptr;
}

const std::unordered_set<std::string>& unit_types() {
  static const std::unordered_set<std::string> types = {
      "function_definition", "function_declaration", "function_item",
      "method_definition",   "method_declaration",   "class_definition",
      "class_declaration",   "class_specifier",      "struct_specifier",
      "enum_specifier",      "union_specifier",      "struct_item",
      "enum_item",           "trait_item",           "impl_item",
      "interface_declaration", "enum_declaration",   "type_declaration",
      "decorated_definition", "template_declaration", "record_declaration",
      "struct_declaration"};
  return types;
}

// Containers whose members count as top-level units.
const std::unordered_set<std::string>& transparent_types() {
  static const std::unordered_set<std::string> types = {
      "namespace_definition", "linkage_specification", "export_statement", "mod_item",
      "namespace_declaration", "declaration_list",     "preproc_if",       "preproc_ifdef"};
  return types;
}

std::string node_text(std::string_view content, TSNode node) {
  const uint32_t start = ts_node_start_byte(node);
  const uint32_t end = ts_node_end_byte(node);
  return std::string(content.substr(start, end - start));
}

TSNode field(TSNode node, const char* name) {
  return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

std::string name_of(std::string_view content, TSNode node) {
  const std::string type = ts_node_type(node);

  if (type == "decorated_definition") {
    TSNode definition = field(node, "definition");
    return ts_node_is_null(definition) ? "" : name_of(content, definition);
  }
  if (type == "template_declaration") {
    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_named_child(node, i);
      if (unit_types().count(ts_node_type(child))) {
        return name_of(content, child);
      }
    }
    return "";
  }
  if (type == "impl_item") {
    TSNode impl_type = field(node, "type");
    return ts_node_is_null(impl_type) ? "" : node_text(content, impl_type);
  }
  if (type == "type_declaration" && ts_node_named_child_count(node) > 0) {
    return name_of(content, ts_node_named_child(node, 0));
  }

  TSNode name = field(node, "name");
  if (!ts_node_is_null(name)) {
    return node_text(content, name);
  }

  // C and C++ functions: walk the declarator chain down to the identifier
  TSNode declarator = field(node, "declarator");
  while (!ts_node_is_null(declarator)) {
    const std::string declarator_type = ts_node_type(declarator);
    if (declarator_type == "identifier" || declarator_type == "field_identifier" ||
        declarator_type == "qualified_identifier" || declarator_type == "destructor_name" ||
        declarator_type == "operator_name") {
      return node_text(content, declarator);
    }
    declarator = field(declarator, "declarator");
  }
  return "";
}

std::string kind_of(TSNode node) {
  const std::string type = ts_node_type(node);
  if (type == "decorated_definition") {
    TSNode definition = field(node, "definition");
    if (!ts_node_is_null(definition)) {
      return ts_node_type(definition);
    }
  }
  return type;
}

void collect_units(std::string_view content, TSNode node, std::vector<CodeUnit>& units) {
  const uint32_t count = ts_node_named_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode child = ts_node_named_child(node, i);
    const std::string type = ts_node_type(child);
    if (unit_types().count(type)) {
      units.push_back(CodeUnit{ts_node_start_byte(child), ts_node_end_byte(child),
                               name_of(content, child), kind_of(child)});
    } else if (transparent_types().count(type)) {
      TSNode body = field(child, "body");
      collect_units(content, ts_node_is_null(body) ? child : body, units);
    }
  }
}

}  // namespace

TreeSitterCodeParser::TreeSitterCodeParser(std::vector<std::string> grammar_dirs)
    : grammar_dirs_(std::move(grammar_dirs)) {}

TreeSitterCodeParser::~TreeSitterCodeParser() {
  for (auto& [language, grammar] : grammars_) {
    if (grammar.handle) {
      dlclose(grammar.handle);
    }
  }
}

bool TreeSitterCodeParser::supports(const std::string& language) const {
  return find_spec(language) != nullptr;
}

std::vector<std::string> TreeSitterCodeParser::library_candidates(
    const std::string& language) const {
  const GrammarSpec* spec = find_spec(language);
  std::vector<std::string> candidates;
  if (!spec) {
    return candidates;
  }
  const std::string core_name = spec->library;
  std::string underscore_name = core_name;
  for (auto& c : underscore_name) {
    if (c == '-') c = '_';
  }
  const std::vector<std::string> lib_names = {"lib" + core_name + ".so", core_name + ".so",
                                              "lib" + underscore_name + ".so"};

  std::vector<std::filesystem::path> search_paths(grammar_dirs_.begin(), grammar_dirs_.end());
  if (const char* env_path = std::getenv("SIFT_TS_GRAMMAR_DIR")) {
    if (*env_path) {
      search_paths.emplace_back(env_path);
    }
  }
  for (const auto& base_path : search_paths) {
    std::error_code ec;
    if (!std::filesystem::exists(base_path, ec)) {
      continue;
    }
    for (const auto& lib_name : lib_names) {
      candidates.push_back((base_path / lib_name).string());
    }
  }
  // Bare names go through the dynamic loader's own search path
  candidates.push_back(lib_names.front());
  return candidates;
}

const TSLanguage* TreeSitterCodeParser::load_grammar(const std::string& language) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = grammars_.find(language);
  if (it != grammars_.end()) {
    return it->second.language;
  }

  Grammar grammar;
  const GrammarSpec* spec = find_spec(language);
  if (spec) {
    for (const auto& candidate : library_candidates(language)) {
      void* handle = dlopen(candidate.c_str(), RTLD_LAZY | RTLD_LOCAL);
      if (!handle) {
        continue;
      }
      auto* factory_fn = reinterpret_cast<const TSLanguage* (*)()>(dlsym(handle, spec->symbol));
      const TSLanguage* ts_language = factory_fn ? factory_fn() : nullptr;
      if (ts_language) {
        grammar.handle = handle;
        grammar.language = ts_language;
        std::cout << "Loaded tree-sitter grammar for " << language << " from " << candidate
                  << std::endl;
        break;
      }
      dlclose(handle);
    }
  }
  grammars_[language] = grammar;
  return grammar.language;
}

std::optional<std::vector<CodeUnit>> TreeSitterCodeParser::parse(
    std::string_view content, const std::string& language) const {
  const TSLanguage* ts_language = load_grammar(language);
  if (!ts_language) {
    return std::nullopt;
  }

  std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(),
                                                                &ts_parser_delete);
  if (!ts_parser_set_language(parser.get(), ts_language)) {
    std::cerr << "Warning: tree-sitter grammar for " << language
              << " has an incompatible ABI version" << std::endl;
    return std::nullopt;
  }
  std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
      ts_parser_parse_string(parser.get(), nullptr, content.data(),
                             static_cast<uint32_t>(content.size())),
      &ts_tree_delete);
  if (!tree) {
    return std::nullopt;
  }

  TSNode root = ts_tree_root_node(tree.get());
  if (ts_node_has_error(root)) {
    return std::nullopt;
  }

  std::vector<CodeUnit> units;
  collect_units(content, root, units);
  return units;
}

}  // namespace sift_core
