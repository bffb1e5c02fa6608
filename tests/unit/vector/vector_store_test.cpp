#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "sift_core/errors.hpp"
#include "sift_core/vector/vector_store.hpp"

namespace sift_tests {

using namespace sift_core;

namespace {

constexpr int kDims = 4;

VectorRecord make_record(int64_t chunk_id,
                         std::vector<float> vector,
                         int64_t document_id = 1,
                         DocumentClass doc_class = DocumentClass::Text,
                         const std::string& language = "en",
                         const std::string& knowledge_base = DEFAULT_KNOWLEDGE_BASE) {
  VectorRecord record;
  record.chunk_id = chunk_id;
  record.document_id = document_id;
  record.version = 1;
  record.knowledge_base = knowledge_base;
  record.doc_class = doc_class;
  record.language = language;
  record.created_at = std::chrono::system_clock::now();
  record.vector = std::move(vector);
  return record;
}

std::vector<int64_t> ids_of(const std::vector<VectorHit>& hits) {
  std::vector<int64_t> ids;
  for (const auto& hit : hits) {
    ids.push_back(hit.chunk_id);
  }
  return ids;
}

}  // namespace

class VectorStoreTest : public ::testing::Test {
 protected:
  VectorStore store_{kDims};
};

TEST_F(VectorStoreTest, Constructor_RejectsNonPositiveDimensions) {
  EXPECT_THROW(VectorStore(0), ConfigurationError);
}

TEST_F(VectorStoreTest, Search_RanksByCosineSimilarity) {
  store_.upsert({make_record(1, {1, 0, 0, 0}), make_record(2, {0, 1, 0, 0}),
                 make_record(3, {1, 1, 0, 0})});

  auto hits = store_.search({10, 1, 0, 0}, 3);

  EXPECT_EQ(ids_of(hits), (std::vector<int64_t>{1, 3, 2}));
  // Magnitude does not matter after normalization
  EXPECT_GT(hits[0].score, 0.99f);
  EXPECT_LE(hits[0].score, 1.0001f);
}

TEST_F(VectorStoreTest, Search_TiesBreakByChunkId) {
  store_.upsert({make_record(9, {0, 0, 1, 0}), make_record(4, {0, 0, 1, 0})});

  EXPECT_EQ(ids_of(store_.search({0, 0, 1, 0}, 2)), (std::vector<int64_t>{4, 9}));
}

TEST_F(VectorStoreTest, Search_HiddenRecordsStayInvisibleUntilPublished) {
  store_.upsert({make_record(1, {1, 0, 0, 0})});
  store_.upsert({make_record(2, {1, 0, 0, 0})}, /*visible*/ false);

  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5)), (std::vector<int64_t>{1}));
  EXPECT_EQ(store_.size(), 2);
  EXPECT_EQ(store_.searchable_size(), 1);

  store_.publish({2});
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5)), (std::vector<int64_t>{1, 2}));
}

TEST_F(VectorStoreTest, Search_DeletedRecordsDropOut) {
  store_.upsert({make_record(1, {1, 0, 0, 0}), make_record(2, {1, 0, 0, 0})});

  store_.mark_deleted({1});
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5)), (std::vector<int64_t>{2}));
  EXPECT_EQ(store_.size(), 2);

  store_.remove({1});
  EXPECT_EQ(store_.size(), 1);
}

TEST_F(VectorStoreTest, Search_FilteredRecordsDoNotConsumeK) {
  // The best match is filtered out; k=1 still returns the best remaining one
  store_.upsert({make_record(1, {1, 0, 0, 0}, 1, DocumentClass::Code, "cpp"),
                 make_record(2, {0.9f, 0.1f, 0, 0}, 2, DocumentClass::Text, "en"),
                 make_record(3, {0, 1, 0, 0}, 3, DocumentClass::Text, "en")});

  VectorFilter filter;
  filter.filters.classes = {DocumentClass::Text};
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 1, filter)), (std::vector<int64_t>{2}));
}

TEST_F(VectorStoreTest, Search_AppliesEveryFilterField) {
  auto old_record = make_record(1, {1, 0, 0, 0}, 1, DocumentClass::Text, "en", "kb-one");
  old_record.created_at = std::chrono::system_clock::now() - std::chrono::hours(48);
  store_.upsert({old_record, make_record(2, {1, 0, 0, 0}, 2, DocumentClass::Code, "cpp", "kb-two"),
                 make_record(3, {1, 0, 0, 0}, 3, DocumentClass::Text, "ru", "kb-one")});

  VectorFilter by_language;
  by_language.filters.languages = {"cpp"};
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5, by_language)), (std::vector<int64_t>{2}));

  VectorFilter by_document;
  by_document.filters.document_ids = {1, 3};
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5, by_document)), (std::vector<int64_t>{1, 3}));

  VectorFilter by_kb;
  by_kb.filters.knowledge_base = "kb-two";
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5, by_kb)), (std::vector<int64_t>{2}));

  VectorFilter recent;
  recent.filters.created_from = std::chrono::system_clock::now() - std::chrono::hours(1);
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5, recent)), (std::vector<int64_t>{2, 3}));

  VectorFilter excluding;
  excluding.exclude_document_ids = {2};
  EXPECT_EQ(ids_of(store_.search({1, 0, 0, 0}, 5, excluding)), (std::vector<int64_t>{1, 3}));
}

TEST_F(VectorStoreTest, Upsert_ReplacesExistingChunk) {
  store_.upsert({make_record(1, {1, 0, 0, 0})});
  store_.upsert({make_record(1, {0, 1, 0, 0})});

  EXPECT_EQ(store_.size(), 1);
  auto hits = store_.search({0, 1, 0, 0}, 1);
  ASSERT_EQ(hits.size(), 1);
  EXPECT_GT(hits[0].score, 0.99f);
}

TEST_F(VectorStoreTest, Upsert_RejectsWrongDimension) {
  EXPECT_THROW(store_.upsert({make_record(1, {1, 0, 0})}), VectorStoreError);
  EXPECT_THROW(store_.search({1, 0}, 1), VectorStoreError);
  EXPECT_EQ(store_.size(), 0);
}

TEST_F(VectorStoreTest, Search_EmptyIndexOrZeroK) {
  EXPECT_TRUE(store_.search({1, 0, 0, 0}, 5).empty());
  store_.upsert({make_record(1, {1, 0, 0, 0})});
  EXPECT_TRUE(store_.search({1, 0, 0, 0}, 0).empty());

  store_.clear();
  EXPECT_EQ(store_.size(), 0);
  EXPECT_TRUE(store_.search({1, 0, 0, 0}, 5).empty());
}

}  // namespace sift_tests
