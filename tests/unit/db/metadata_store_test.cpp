#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "sift_core/db/metadata_store.hpp"

namespace sift_core {

class MetadataStoreTest : public sift_tests::MetadataStoreTestBase {
 protected:
  VersionWrite make_write(const std::string& origin,
                          const std::vector<std::string>& texts,
                          const std::string& hash,
                          const std::string& knowledge_base = DEFAULT_KNOWLEDGE_BASE,
                          DocumentClass doc_class = DocumentClass::Text) {
    VersionWrite write;
    write.knowledge_base = knowledge_base;
    write.origin = origin;
    write.content_hash = hash;
    write.doc_class = doc_class;
    for (auto& chunk : sift_tests::TestUtilities::create_test_chunks(texts, doc_class)) {
      ChunkWrite item;
      item.embedding = embedder_.embed(chunk.content);
      item.chunk = std::move(chunk);
      write.chunks.push_back(std::move(item));
    }
    return write;
  }

  sift_tests::FakeEmbedder embedder_;
};

TEST_F(MetadataStoreTest, WriteVersion_NewDocumentStartsAtVersionOne) {
  auto write = make_write("docs/a.txt", {"first chunk text", "second chunk text"}, "hash-1");
  write.chunks[1].chunk.attributes.symbol_name = "Intro";

  auto result = metadata_store_->write_version(write);

  EXPECT_FALSE(result.unchanged);
  EXPECT_EQ(result.version, 1);
  ASSERT_EQ(result.chunk_ids.size(), 2);
  EXPECT_TRUE(result.superseded_chunk_ids.empty());

  auto doc = metadata_store_->get_document(result.document_id);
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->origin, "docs/a.txt");
  EXPECT_EQ(doc->knowledge_base, DEFAULT_KNOWLEDGE_BASE);
  EXPECT_EQ(doc->current_version, 1);
  EXPECT_EQ(doc->content_hash, "hash-1");

  auto chunks = metadata_store_->list_chunks(result.document_id);
  ASSERT_EQ(chunks.size(), 2);
  EXPECT_EQ(chunks[0].content, "first chunk text");
  EXPECT_EQ(chunks[1].content, "second chunk text");
  EXPECT_EQ(chunks[1].attributes.symbol_name, "Intro");
  EXPECT_EQ(chunks[1].origin, "docs/a.txt");
  EXPECT_EQ(chunks[1].start_offset, chunks[0].end_offset);
  EXPECT_FALSE(chunks[0].is_deleted);
}

TEST_F(MetadataStoreTest, WriteVersion_SameHashIsUnchanged) {
  auto first = metadata_store_->write_version(make_write("a.txt", {"same text"}, "hash-1"));
  auto second = metadata_store_->write_version(make_write("a.txt", {"same text"}, "hash-1"));

  EXPECT_TRUE(second.unchanged);
  EXPECT_EQ(second.document_id, first.document_id);
  EXPECT_EQ(second.version, 1);
  EXPECT_TRUE(second.chunk_ids.empty());
  EXPECT_EQ(metadata_store_->list_versions(first.document_id).size(), 1);
}

TEST_F(MetadataStoreTest, WriteVersion_NewContentSupersedesPreviousChunks) {
  auto v1 = metadata_store_->write_version(make_write("a.txt", {"old one", "old two"}, "hash-1"));
  auto v2 = metadata_store_->write_version(make_write("a.txt", {"new content"}, "hash-2"));

  EXPECT_EQ(v2.document_id, v1.document_id);
  EXPECT_EQ(v2.version, 2);
  EXPECT_EQ(v2.superseded_chunk_ids, v1.chunk_ids);

  auto live = metadata_store_->list_chunks(v1.document_id);
  ASSERT_EQ(live.size(), 1);
  EXPECT_EQ(live[0].version, 2);
  EXPECT_EQ(live[0].content, "new content");

  auto old = metadata_store_->list_chunks(v1.document_id, 1, /*include_deleted*/ true);
  ASSERT_EQ(old.size(), 2);
  EXPECT_TRUE(old[0].is_deleted);

  auto versions = metadata_store_->list_versions(v1.document_id);
  ASSERT_EQ(versions.size(), 2);
  EXPECT_EQ(versions[1].content_hash, "hash-2");
  EXPECT_EQ(metadata_store_->get_document(v1.document_id)->current_version, 2);
}

TEST_F(MetadataStoreTest, WriteVersion_SameOriginInOtherKnowledgeBaseIsSeparate) {
  auto a = metadata_store_->write_version(make_write("a.txt", {"text"}, "h", "kb-one"));
  auto b = metadata_store_->write_version(make_write("a.txt", {"text"}, "h", "kb-two"));

  EXPECT_NE(a.document_id, b.document_id);
  EXPECT_FALSE(b.unchanged);
  EXPECT_EQ(metadata_store_->list_documents(std::string("kb-one")).size(), 1);
  EXPECT_EQ(metadata_store_->list_documents().size(), 2);
}

TEST_F(MetadataStoreTest, WriteVersion_FailureBeforeCommitRollsBack) {
  auto write = make_write("a.txt", {"never visible"}, "hash-1");

  EXPECT_THROW(metadata_store_->write_version(
                   write, [](const VersionWriteResult&) { throw std::runtime_error("boom"); }),
               std::runtime_error);

  EXPECT_FALSE(metadata_store_->get_document_by_origin(DEFAULT_KNOWLEDGE_BASE, "a.txt"));
  EXPECT_TRUE(metadata_store_->lexical_search("visible", 10, {}).empty());
  EXPECT_TRUE(metadata_store_->load_live_embeddings().empty());
}

TEST_F(MetadataStoreTest, WriteVersion_RejectsEmptyOriginOrChunks) {
  EXPECT_THROW(metadata_store_->write_version(make_write("", {"x"}, "h")), ValidationError);
  EXPECT_THROW(metadata_store_->write_version(make_write("a.txt", {}, "h")), ValidationError);
}

TEST_F(MetadataStoreTest, LexicalSearch_RanksLiveChunksOnly) {
  auto v1 = metadata_store_->write_version(
      make_write("a.txt", {"alpha beta", "gamma delta gamma", "epsilon"}, "hash-1"));

  auto hits = metadata_store_->lexical_search("gamma", 10, {});
  ASSERT_EQ(hits.size(), 1);
  EXPECT_EQ(hits[0].chunk_id, v1.chunk_ids[1]);
  EXPECT_GT(hits[0].score, 0.0);

  metadata_store_->write_version(make_write("a.txt", {"alpha only now"}, "hash-2"));
  EXPECT_TRUE(metadata_store_->lexical_search("gamma", 10, {}).empty());
  EXPECT_EQ(metadata_store_->lexical_search("alpha", 10, {}).size(), 1);
}

TEST_F(MetadataStoreTest, LexicalSearch_AnyTermMatches) {
  metadata_store_->write_version(make_write("a.txt", {"red apples", "green pears"}, "h1"));

  auto hits = metadata_store_->lexical_search("apples pears bananas", 10, {});
  EXPECT_EQ(hits.size(), 2);
  EXPECT_TRUE(metadata_store_->lexical_search("!!!", 10, {}).empty());
}

TEST_F(MetadataStoreTest, LexicalSearch_AppliesFilters) {
  auto text_doc = metadata_store_->write_version(
      make_write("notes.txt", {"shared keyword here"}, "h1", "kb-one", DocumentClass::Text));
  auto code_doc = metadata_store_->write_version(
      make_write("main.cpp", {"shared keyword there"}, "h2", "kb-two", DocumentClass::Code));

  SearchFilters by_class;
  by_class.classes = {DocumentClass::Code};
  auto hits = metadata_store_->lexical_search("keyword", 10, by_class);
  ASSERT_EQ(hits.size(), 1);
  EXPECT_EQ(hits[0].chunk_id, code_doc.chunk_ids[0]);

  SearchFilters by_kb;
  by_kb.knowledge_base = "kb-one";
  hits = metadata_store_->lexical_search("keyword", 10, by_kb);
  ASSERT_EQ(hits.size(), 1);
  EXPECT_EQ(hits[0].chunk_id, text_doc.chunk_ids[0]);

  SearchFilters by_language;
  by_language.languages = {"cpp"};
  hits = metadata_store_->lexical_search("keyword", 10, by_language);
  ASSERT_EQ(hits.size(), 1);
  EXPECT_EQ(hits[0].chunk_id, code_doc.chunk_ids[0]);

  SearchFilters by_document;
  by_document.document_ids = {text_doc.document_id};
  hits = metadata_store_->lexical_search("keyword", 10, by_document);
  ASSERT_EQ(hits.size(), 1);
  EXPECT_EQ(hits[0].chunk_id, text_doc.chunk_ids[0]);

  SearchFilters future_only;
  future_only.created_from = std::chrono::system_clock::now() + std::chrono::hours(1);
  EXPECT_TRUE(metadata_store_->lexical_search("keyword", 10, future_only).empty());
}

TEST_F(MetadataStoreTest, BuildMatchExpression_QuotesAndDeduplicatesTerms) {
  EXPECT_EQ(MetadataStore::build_match_expression("Hello, world! hello"),
            "\"Hello\" OR \"world\"");
  EXPECT_EQ(MetadataStore::build_match_expression("AND OR NOT"), "\"AND\" OR \"OR\" OR \"NOT\"");
  EXPECT_EQ(MetadataStore::build_match_expression("  ...  "), "");
}

TEST_F(MetadataStoreTest, GetChunks_KeepsRequestedOrderAndSkipsUnknown) {
  auto v1 = metadata_store_->write_version(make_write("a.txt", {"one", "two", "three"}, "h"));

  auto chunks = metadata_store_->get_chunks({v1.chunk_ids[2], 999999, v1.chunk_ids[0]});
  ASSERT_EQ(chunks.size(), 2);
  EXPECT_EQ(chunks[0].content, "three");
  EXPECT_EQ(chunks[1].content, "one");
}

TEST_F(MetadataStoreTest, GetAdjacentChunk_StaysWithinVersion) {
  auto v1 = metadata_store_->write_version(make_write("a.txt", {"one", "two", "three"}, "h"));
  auto middle = metadata_store_->get_chunks({v1.chunk_ids[1]}).front();

  auto previous = metadata_store_->get_adjacent_chunk(middle, Adjacency::Previous);
  auto next = metadata_store_->get_adjacent_chunk(middle, Adjacency::Next);
  ASSERT_TRUE(previous.has_value());
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(previous->content, "one");
  EXPECT_EQ(next->content, "three");

  auto first = metadata_store_->get_chunks({v1.chunk_ids[0]}).front();
  EXPECT_FALSE(metadata_store_->get_adjacent_chunk(first, Adjacency::Previous).has_value());
}

TEST_F(MetadataStoreTest, LoadLiveEmbeddings_SkipsSupersededVectors) {
  metadata_store_->write_version(make_write("a.txt", {"old one", "old two"}, "hash-1"));
  auto v2 = metadata_store_->write_version(make_write("a.txt", {"new one"}, "hash-2"));

  auto rows = metadata_store_->load_live_embeddings();
  ASSERT_EQ(rows.size(), 1);
  EXPECT_EQ(rows[0].chunk_id, v2.chunk_ids[0]);
  EXPECT_EQ(rows[0].version, 2);
  EXPECT_EQ(rows[0].vector, embedder_.embed("new one"));
}

TEST_F(MetadataStoreTest, DeleteDocument_RemovesAllRows) {
  auto v1 = metadata_store_->write_version(make_write("a.txt", {"old text"}, "hash-1"));
  auto v2 = metadata_store_->write_version(make_write("a.txt", {"new text"}, "hash-2"));

  auto removed = metadata_store_->delete_document(v1.document_id);

  EXPECT_EQ(removed.size(), 2);
  EXPECT_FALSE(metadata_store_->get_document(v1.document_id).has_value());
  EXPECT_TRUE(metadata_store_->list_chunks(v1.document_id, std::nullopt, true).empty());
  EXPECT_TRUE(metadata_store_->list_versions(v1.document_id).empty());
  EXPECT_TRUE(metadata_store_->lexical_search("text", 10, {}).empty());
  EXPECT_TRUE(metadata_store_->load_live_embeddings().empty());
  EXPECT_THROW(metadata_store_->delete_document(v2.document_id), NotFoundError);
}

TEST_F(MetadataStoreTest, DeleteDocument_KeepsJobHistory) {
  auto v1 = metadata_store_->write_version(make_write("a.txt", {"text"}, "hash-1"));
  long long job_id = job_repo_->create_job({DEFAULT_KNOWLEDGE_BASE, "a.txt", "hash-1", {}, "text"});
  job_repo_->set_document(job_id, v1.document_id);

  metadata_store_->delete_document(v1.document_id);

  auto job = job_repo_->get_job(job_id);
  ASSERT_TRUE(job.has_value());
  EXPECT_FALSE(job->document_id.has_value());
}

TEST_F(MetadataStoreTest, PurgeDeletedChunks_DropsOnlySupersededRows) {
  auto v1 = metadata_store_->write_version(make_write("a.txt", {"old alpha", "old beta"}, "h1"));
  auto v2 = metadata_store_->write_version(make_write("a.txt", {"new alpha"}, "h2"));

  // Nothing was superseded an hour ago
  EXPECT_TRUE(metadata_store_
                  ->purge_deleted_chunks(std::chrono::system_clock::now() - std::chrono::hours(1))
                  .empty());

  auto purged =
      metadata_store_->purge_deleted_chunks(std::chrono::system_clock::now() + std::chrono::hours(1));
  EXPECT_EQ(purged, v1.chunk_ids);
  EXPECT_TRUE(metadata_store_->list_chunks(v1.document_id, 1, true).empty());
  EXPECT_EQ(metadata_store_->list_chunks(v1.document_id).size(), 1);

  auto hits = metadata_store_->lexical_search("alpha", 10, {});
  ASSERT_EQ(hits.size(), 1);
  EXPECT_EQ(hits[0].chunk_id, v2.chunk_ids[0]);
}

TEST_F(MetadataStoreTest, FindDocumentsByOriginPrefix_MatchesLiteralPrefix) {
  auto a = metadata_store_->write_version(make_write("src/a.cpp", {"a"}, "h1"));
  auto b = metadata_store_->write_version(make_write("src/b.cpp", {"b"}, "h2"));
  metadata_store_->write_version(make_write("docs/c.md", {"c"}, "h3"));
  metadata_store_->write_version(make_write("src_old/d.cpp", {"d"}, "h4"));

  auto ids = metadata_store_->find_documents_by_origin_prefix(DEFAULT_KNOWLEDGE_BASE, "src/");
  EXPECT_EQ(ids, (std::vector<int64_t>{a.document_id, b.document_id}));
  EXPECT_TRUE(metadata_store_->find_documents_by_origin_prefix("other", "src/").empty());
}

TEST_F(MetadataStoreTest, IndexDimensions_PersistAcrossCalls) {
  metadata_store_->set_index_dimensions(128);
  EXPECT_EQ(metadata_store_->get_index_dimensions(), 128);
  metadata_store_->set_index_dimensions(256);
  EXPECT_EQ(metadata_store_->get_index_dimensions(), 256);
}

}  // namespace sift_core
