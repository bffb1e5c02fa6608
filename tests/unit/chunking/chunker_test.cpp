#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sift_core/chunking/chunker.hpp"
#include "sift_core/errors.hpp"

namespace sift_tests {

using namespace sift_core;

namespace {

// Every byte of the source belongs to some chunk and each chunk is exactly its span
void expect_covers(const std::string& content, const std::vector<Chunk>& chunks) {
  ASSERT_FALSE(chunks.empty());
  EXPECT_EQ(chunks.front().start_offset, 0);
  EXPECT_EQ(chunks.back().end_offset, content.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    const Chunk& chunk = chunks[i];
    EXPECT_EQ(chunk.chunk_index, static_cast<int>(i));
    EXPECT_LT(chunk.start_offset, chunk.end_offset);
    EXPECT_EQ(chunk.content,
              content.substr(chunk.start_offset, chunk.end_offset - chunk.start_offset));
    EXPECT_GT(chunk.token_count, 0);
    if (i > 0) {
      EXPECT_LE(chunk.start_offset, chunks[i - 1].end_offset) << "gap before chunk " << i;
      EXPECT_EQ(chunk.overlap_bytes, chunks[i - 1].end_offset - chunk.start_offset);
    }
  }
}

std::string paragraph(const std::string& topic) {
  return "The " + topic +
         " paragraph explains how the system behaves when requests arrive faster than the "
         "workers can drain them, and what operators should watch for.";
}

}  // namespace

class ChunkerTest : public ::testing::Test {
 protected:
  ChunkingSettings settings_;
};

TEST_F(ChunkerTest, Chunk_RejectsEmptyAndWhitespaceContent) {
  Chunker chunker(settings_);
  EXPECT_THROW(chunker.chunk("", DocumentClass::Text, {}), ValidationError);
  EXPECT_THROW(chunker.chunk("  \n\t\n", DocumentClass::Text, {}), ValidationError);
}

TEST_F(ChunkerTest, Chunk_RejectsInvalidUtf8) {
  Chunker chunker(settings_);
  std::string content = "valid prefix \xff\xfe then garbage";
  EXPECT_THROW(chunker.chunk(content, DocumentClass::Text, {}), ValidationError);
}

TEST_F(ChunkerTest, Chunk_MarkdownThreeSectionsGiveThreeSectionChunks) {
  std::string content = "# Alpha\n\n" + paragraph("first") + "\n\n## Beta\n\n" +
                        paragraph("second") + "\n\n## Gamma\n\n" + paragraph("third") + "\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Markdown, {"guide.md"});

  ASSERT_EQ(chunks.size(), 3);
  expect_covers(content, chunks);
  EXPECT_EQ(chunks[0].attributes.symbol_name, "Alpha");
  EXPECT_EQ(chunks[1].attributes.symbol_name, "Beta");
  EXPECT_EQ(chunks[2].attributes.symbol_name, "Gamma");
  EXPECT_EQ(chunks[1].content.rfind("## Beta", 0), 0);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.attributes.node_kind, "section");
    EXPECT_EQ(chunk.doc_class, DocumentClass::Markdown);
    EXPECT_EQ(chunk.overlap_bytes, 0);
  }
}

TEST_F(ChunkerTest, Chunk_ShortMarkdownSectionsStayAlignedToHeadings) {
  std::string content =
      "# Install\nRun make install.\n\n# Configure\nEdit siftrc.json.\n\n# Run\nStart sift_server.\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Markdown, {"readme.md"});

  ASSERT_EQ(chunks.size(), 3);
  expect_covers(content, chunks);
  EXPECT_EQ(chunks[0].content, "# Install\nRun make install.\n\n");
  EXPECT_EQ(chunks[1].content, "# Configure\nEdit siftrc.json.\n\n");
  EXPECT_EQ(chunks[2].content, "# Run\nStart sift_server.\n");
  EXPECT_EQ(chunks[0].attributes.symbol_name, "Install");
  EXPECT_EQ(chunks[1].attributes.symbol_name, "Configure");
  EXPECT_EQ(chunks[2].attributes.symbol_name, "Run");
}

TEST_F(ChunkerTest, Chunk_BareHeadingFoldsForwardKeepingItsTitle) {
  std::string content =
      "# Guide\n\n## Install\nRun make install.\n\n## Run\nStart sift_server.\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Markdown, {"guide.md"});

  ASSERT_EQ(chunks.size(), 2);
  expect_covers(content, chunks);
  EXPECT_EQ(chunks[0].content.rfind("# Guide\n\n## Install", 0), 0);
  EXPECT_EQ(chunks[0].attributes.symbol_name, "Guide");
  EXPECT_EQ(chunks[1].attributes.symbol_name, "Run");
}

TEST_F(ChunkerTest, Chunk_TrailingBareHeadingJoinsPreviousSection) {
  std::string content = "# Notes\nKeep the pool larger than the worker count.\n\n# Appendix\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Markdown, {"notes.md"});

  ASSERT_EQ(chunks.size(), 1);
  EXPECT_EQ(chunks[0].content, content);
  EXPECT_EQ(chunks[0].attributes.symbol_name, "Notes");
}

TEST_F(ChunkerTest, Chunk_MarkdownHeadingInsideFenceDoesNotSplit) {
  std::string content = "# Setup\n\n" + paragraph("install") +
                        "\n\n```bash\n# not a heading\nmake install\n```\n\n" + paragraph("after");
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Markdown, {"setup.md"});

  ASSERT_EQ(chunks.size(), 1);
  EXPECT_EQ(chunks[0].attributes.symbol_name, "Setup");
}

TEST_F(ChunkerTest, Chunk_CodeFileWithTwoFunctionsGivesTwoNamedChunks) {
  std::string content =
      "int add(int a, int b) {\n"
      "  return a + b;\n"
      "}\n"
      "\n"
      "int multiply(int a, int b) {\n"
      "  return a * b;\n"
      "}\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Code, {"math.cpp"});

  ASSERT_EQ(chunks.size(), 2);
  expect_covers(content, chunks);
  EXPECT_EQ(chunks[0].attributes.symbol_name, "add");
  EXPECT_EQ(chunks[1].attributes.symbol_name, "multiply");
  EXPECT_EQ(chunks[0].language, "cpp");
  EXPECT_EQ(chunks[0].doc_class, DocumentClass::Code);
  EXPECT_EQ(chunks[0].attributes.line_start, 1);
  EXPECT_EQ(chunks[0].attributes.line_end, 3);
}

TEST_F(ChunkerTest, Chunk_MalformedCodeFallsBackToWindows) {
  std::string content =
      "int broken(int a) {\n"
      "  if (a > 0) {\n"
      "    return a;\n"
      "}\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Code, {"broken.cpp"});

  expect_covers(content, chunks);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.doc_class, DocumentClass::Code);
    EXPECT_TRUE(chunk.attributes.symbol_name.empty());
  }
}

TEST_F(ChunkerTest, Chunk_LongTextPacksParagraphsWithOverlap) {
  settings_.text = {50, 100, 10, 0};
  std::string content;
  for (int i = 0; i < 10; ++i) {
    content += paragraph("topic " + std::to_string(i)) + "\n\n";
  }
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Text, {"notes.txt"});

  ASSERT_GT(chunks.size(), 1);
  expect_covers(content, chunks);
  bool any_overlap = false;
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.token_count, 100 + 10 + 40);
    EXPECT_EQ(chunk.language, "en");
    any_overlap = any_overlap || chunk.overlap_bytes > 0;
  }
  EXPECT_TRUE(any_overlap);
}

TEST_F(ChunkerTest, Chunk_TableRepeatsHeaderOnEveryChunk) {
  settings_.table = {16, 64, 0, 1};
  std::string header = "id,name,city,balance";
  std::string content = header + "\n";
  for (int i = 0; i < 60; ++i) {
    content += std::to_string(i) + ",customer" + std::to_string(i) + ",Springfield," +
               std::to_string(i * 10) + ".00\n";
  }
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Table, {"customers.csv"});

  ASSERT_GT(chunks.size(), 1);
  expect_covers(content, chunks);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.attributes.table_header, header);
    EXPECT_EQ(chunk.attributes.node_kind, "rows");
  }
  // One overlapping row between neighbours
  EXPECT_GT(chunks[1].overlap_bytes, 0);
}

TEST_F(ChunkerTest, Chunk_LogKeepsStackTracesWithTheirEntry) {
  settings_.log = {8, 40, 0, 0};
  std::string content;
  for (int i = 0; i < 8; ++i) {
    content += "2024-05-01 12:00:0" + std::to_string(i) + " ERROR request " + std::to_string(i) +
               " failed\n"
               "    at handler.process(handler.cpp:42)\n"
               "    at server.dispatch(server.cpp:17)\n";
  }
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Log, {"app.log"});

  ASSERT_GT(chunks.size(), 1);
  expect_covers(content, chunks);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.content.rfind("2024-05-01", 0), 0) << chunk.content;
  }
}

TEST_F(ChunkerTest, Chunk_JsonConfigSplitsAtTopLevelKeys) {
  settings_.config = {4, 24, 0, 0};
  settings_.min_fragment_tokens = 4;
  std::string content =
      "{\n"
      "  \"server\": {\"host\": \"127.0.0.1\", \"port\": 8080, \"threads\": 4},\n"
      "  \"database\": {\"path\": \"/var/lib/app.db\", \"pool\": 8},\n"
      "  \"logging\": {\"level\": \"info\", \"file\": \"/var/log/app.log\"}\n"
      "}\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Config, {"app.json"});

  ASSERT_EQ(chunks.size(), 3);
  expect_covers(content, chunks);
  EXPECT_EQ(chunks[0].attributes.symbol_name, "server");
  EXPECT_EQ(chunks[1].attributes.symbol_name, "database");
  EXPECT_EQ(chunks[2].attributes.symbol_name, "logging");
}

TEST_F(ChunkerTest, Chunk_MalformedJsonFallsBackToFixedWindows) {
  std::string content = "{\n  \"items\": [1, 2, 3,\n  \"name\": \"unterminated\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Config, {"bad.json"});

  expect_covers(content, chunks);
  EXPECT_EQ(chunks[0].attributes.node_kind, "window");
}

TEST_F(ChunkerTest, Chunk_MixedDocumentKeepsRegionClasses) {
  std::string content = paragraph("introduction") + "\n" + paragraph("background") +
                        "\n\n```python\ndef handler(event):\n    return process(event)\n\n"
                        "def process(event):\n    return event['body'].strip().lower()\n```\n";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Mixed, {"notes"});

  expect_covers(content, chunks);
  ASSERT_GE(chunks.size(), 2);
  EXPECT_EQ(chunks.front().doc_class, DocumentClass::Text);
  EXPECT_EQ(chunks.back().doc_class, DocumentClass::Markdown);
  for (const auto& chunk : chunks) {
    EXPECT_NE(chunk.doc_class, DocumentClass::Mixed);
  }
}

TEST_F(ChunkerTest, Chunk_TinyTrailingFragmentMergesIntoPredecessor) {
  settings_.text = {20, 40, 0, 0};
  std::string content = paragraph("only") + "\n\nEnd.";
  Chunker chunker(settings_);
  auto chunks = chunker.chunk(content, DocumentClass::Text, {"short.txt"});

  expect_covers(content, chunks);
  EXPECT_NE(chunks.back().content.find("End."), std::string::npos);
  EXPECT_NE(chunks.back().content, "End.");
}

TEST(ChunkerCoverageTest, Covers_DetectsGapsAndMisordering) {
  std::vector<Span> spans(2);
  spans[0].start = 0;
  spans[0].end = 10;
  spans[1].start = 8;
  spans[1].end = 20;
  EXPECT_TRUE(Chunker::covers(spans, 20));

  spans[1].start = 12;
  EXPECT_FALSE(Chunker::covers(spans, 20)) << "gap";

  spans[1].start = 10;
  EXPECT_FALSE(Chunker::covers(spans, 25)) << "short of the end";
  EXPECT_FALSE(Chunker::covers({}, 5));
}

}  // namespace sift_tests
