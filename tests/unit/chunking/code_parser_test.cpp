#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "sift_core/chunking/chunking_strategy.hpp"
#include "sift_core/chunking/code/heuristic_code_parser.hpp"
#include "sift_core/chunking/code/tree_sitter_code_parser.hpp"
#include "sift_core/chunking/code_strategy.hpp"

namespace sift_tests {

using namespace sift_core;

class HeuristicCodeParserTest : public ::testing::Test {
 protected:
  HeuristicCodeParser parser_;
};

TEST_F(HeuristicCodeParserTest, Parse_NamespaceMembersAreTopLevelUnits) {
  std::string content =
      "#include <string>\n"
      "\n"
      "namespace util {\n"
      "\n"
      "std::string trim(const std::string& s) {\n"
      "  return s;\n"
      "}\n"
      "\n"
      "class Cache {\n"
      " public:\n"
      "  int size() const { return 0; }\n"
      "};\n"
      "\n"
      "}  // namespace util\n";
  auto units = parser_.parse(content, "cpp");

  ASSERT_TRUE(units.has_value());
  ASSERT_EQ(units->size(), 2);
  EXPECT_EQ((*units)[0].name, "trim");
  EXPECT_EQ((*units)[0].kind, "function");
  EXPECT_EQ((*units)[1].name, "Cache");
  EXPECT_EQ((*units)[1].kind, "class");
  // The class unit swallows its trailing semicolon
  EXPECT_EQ(content[(*units)[1].end - 1], ';');
}

TEST_F(HeuristicCodeParserTest, Parse_BracesInsideStringsAndCommentsAreIgnored) {
  std::string content =
      "void greet() {\n"
      "  // a stray } in a comment\n"
      "  const char* s = \"{ not a block\";\n"
      "  char c = '}';\n"
      "}\n"
      "/* } */\n"
      "void bye() {\n"
      "}\n";
  auto units = parser_.parse(content, "c");

  ASSERT_TRUE(units.has_value());
  ASSERT_EQ(units->size(), 2);
  EXPECT_EQ((*units)[0].name, "greet");
  EXPECT_EQ((*units)[1].name, "bye");
}

TEST_F(HeuristicCodeParserTest, Parse_UnbalancedBracesThrow) {
  EXPECT_THROW(parser_.parse("int f() {\n  return 1;\n", "cpp"), ChunkingError);
  EXPECT_THROW(parser_.parse("int f() {}\n}\n", "cpp"), ChunkingError);
}

TEST_F(HeuristicCodeParserTest, Parse_PythonDefinitionsIncludeDecorators) {
  std::string content =
      "import functools\n"
      "\n"
      "@functools.cache\n"
      "def load(path):\n"
      "    with open(path) as f:\n"
      "        return f.read()\n"
      "\n"
      "\n"
      "class Store:\n"
      "    def get(self, key):\n"
      "        return key\n";
  auto units = parser_.parse(content, "python");

  ASSERT_TRUE(units.has_value());
  ASSERT_EQ(units->size(), 2);
  EXPECT_EQ((*units)[0].name, "load");
  EXPECT_EQ((*units)[0].kind, "function");
  EXPECT_EQ(content.substr((*units)[0].start, 1), "@");
  EXPECT_EQ((*units)[1].name, "Store");
  EXPECT_EQ((*units)[1].kind, "class");
  EXPECT_EQ((*units)[1].end, content.size());
}

TEST_F(HeuristicCodeParserTest, Supports_KnownFamiliesOnly) {
  EXPECT_TRUE(parser_.supports("cpp"));
  EXPECT_TRUE(parser_.supports("python"));
  EXPECT_TRUE(parser_.supports("rust"));
  EXPECT_FALSE(parser_.supports("ruby"));
  EXPECT_FALSE(parser_.parse("puts 1", "ruby").has_value());
}

TEST(TreeSitterCodeParserTest, Parse_MissingGrammarReturnsNullopt) {
  TreeSitterCodeParser parser({"/nonexistent/grammar/dir"});
  // Unknown languages never reach dlopen
  EXPECT_FALSE(parser.supports("cobol"));
  EXPECT_FALSE(parser.parse("IDENTIFICATION DIVISION.", "cobol").has_value());
}

TEST(CodeStrategyTest, Split_FallsBackToWindowsWhenNoParserFindsUnits) {
  ChunkingSettings settings;
  std::vector<CodeParserPtr> parsers;
  parsers.push_back(std::make_unique<HeuristicCodeParser>());
  CodeStrategy strategy(settings, std::move(parsers));

  std::string content = "x = 1\ny = 2\nprint(x + y)\n";
  ChunkContext context;
  context.origin = "script.py";
  auto spans = strategy.split(content, context);

  ASSERT_EQ(spans.size(), 1);
  EXPECT_EQ(spans[0].start, 0);
  EXPECT_EQ(spans[0].end, content.size());
  EXPECT_EQ(spans[0].language, "python");
  EXPECT_EQ(spans[0].attributes.node_kind, "window");
}

TEST(CodeStrategyTest, Split_OversizedUnitIsWindowedKeepingItsName) {
  ChunkingSettings settings;
  settings.code = {0, 32, 0, 0};
  std::vector<CodeParserPtr> parsers;
  parsers.push_back(std::make_unique<HeuristicCodeParser>());
  CodeStrategy strategy(settings, std::move(parsers));

  std::string body;
  for (int i = 0; i < 20; ++i) {
    body += "  total += values[" + std::to_string(i) + "] * weights[" + std::to_string(i) + "];\n";
  }
  std::string content = "double score(const double* values, const double* weights) {\n"
                        "  double total = 0;\n" + body + "  return total;\n}\n";
  ChunkContext context;
  context.origin = "score.c";
  auto spans = strategy.split(content, context);

  ASSERT_GT(spans.size(), 1);
  for (const auto& span : spans) {
    EXPECT_EQ(span.attributes.symbol_name, "score");
    EXPECT_EQ(span.doc_class, DocumentClass::Code);
  }
  EXPECT_EQ(spans.front().start, 0);
  EXPECT_EQ(spans.back().end, content.size());
}

}  // namespace sift_tests
