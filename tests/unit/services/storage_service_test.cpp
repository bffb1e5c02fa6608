#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "sift_core/services/storage_service.hpp"

namespace sift_tests {

using namespace sift_core;

class StorageServiceTest : public MetadataStoreTestBase {
 protected:
  std::vector<int64_t> vector_ids(const std::string& query, size_t k = 10) {
    std::vector<int64_t> ids;
    for (const auto& hit : vector_store_->search(embedder_.embed(query), k)) {
      ids.push_back(hit.chunk_id);
    }
    return ids;
  }

  FakeEmbedder embedder_;
};

TEST_F(StorageServiceTest, CommitVersion_MakesChunksSearchableInBothIndexes) {
  auto version = TestUtilities::create_test_version(
      "guide.txt", {"install the package", "configure the server"}, embedder_);

  auto result = storage_->commit_version(version);

  EXPECT_FALSE(result.unchanged);
  EXPECT_EQ(result.version, 1);
  ASSERT_EQ(result.chunk_ids.size(), 2);
  EXPECT_EQ(vector_store_->searchable_size(), 2);
  EXPECT_EQ(vector_ids("configure the server").front(), result.chunk_ids[1]);

  auto lexical = metadata_store_->lexical_search("install", 10, {});
  ASSERT_EQ(lexical.size(), 1);
  EXPECT_EQ(lexical[0].chunk_id, result.chunk_ids[0]);
}

TEST_F(StorageServiceTest, CommitVersion_UnchangedContentWritesNothing) {
  auto version = TestUtilities::create_test_version("a.txt", {"same words"}, embedder_);
  auto first = storage_->commit_version(version);
  auto second = storage_->commit_version(version);

  EXPECT_TRUE(second.unchanged);
  EXPECT_EQ(second.document_id, first.document_id);
  EXPECT_EQ(second.version, 1);
  EXPECT_EQ(vector_store_->size(), 1);
  EXPECT_EQ(metadata_store_->list_versions(first.document_id).size(), 1);
}

TEST_F(StorageServiceTest, CommitVersion_NewVersionReplacesOldInSearch) {
  auto v1 = storage_->commit_version(
      TestUtilities::create_test_version("a.txt", {"legacy billing flow"}, embedder_));
  auto v2 = storage_->commit_version(
      TestUtilities::create_test_version("a.txt", {"modern billing flow"}, embedder_));

  EXPECT_EQ(v2.version, 2);
  EXPECT_EQ(v2.superseded_chunks, 1);
  EXPECT_EQ(vector_store_->searchable_size(), 1);
  EXPECT_EQ(vector_ids("legacy billing flow"), (std::vector<int64_t>{v2.chunk_ids[0]}));

  auto lexical = metadata_store_->lexical_search("billing", 10, {});
  ASSERT_EQ(lexical.size(), 1);
  EXPECT_EQ(lexical[0].chunk_id, v2.chunk_ids[0]);
  EXPECT_NE(v1.chunk_ids[0], v2.chunk_ids[0]);
}

TEST_F(StorageServiceTest, CommitVersion_ValidationFailureLeavesStoresUntouched) {
  auto version = TestUtilities::create_test_version("a.txt", {"one", "two"}, embedder_);
  version.embeddings.pop_back();
  EXPECT_THROW(storage_->commit_version(version), ValidationError);

  auto wrong_dims = TestUtilities::create_test_version("a.txt", {"one"}, embedder_);
  wrong_dims.embeddings[0].resize(TEST_DIMENSIONS / 2);
  EXPECT_THROW(storage_->commit_version(wrong_dims), ValidationError);

  auto no_origin = TestUtilities::create_test_version("", {"one"}, embedder_);
  EXPECT_THROW(storage_->commit_version(no_origin), ValidationError);

  EXPECT_EQ(vector_store_->size(), 0);
  EXPECT_TRUE(metadata_store_->list_documents().empty());
}

TEST_F(StorageServiceTest, CommitVersion_WaitsForOpenSnapshots) {
  storage_->commit_version(TestUtilities::create_test_version("a.txt", {"version one"}, embedder_));

  std::atomic<bool> committed{false};
  std::thread writer;
  {
    auto snapshot = storage_->acquire_snapshot();
    writer = std::thread([&]() {
      storage_->commit_version(
          TestUtilities::create_test_version("a.txt", {"version two"}, embedder_));
      committed.store(true);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    // Readers holding the snapshot still see version one
    EXPECT_FALSE(committed.load());
    auto live = metadata_store_->load_live_embeddings();
    ASSERT_EQ(live.size(), 1);
    EXPECT_EQ(live[0].version, 1);
  }
  writer.join();

  EXPECT_TRUE(committed.load());
  EXPECT_EQ(metadata_store_->get_document_by_origin(DEFAULT_KNOWLEDGE_BASE, "a.txt")->current_version,
            2);
}

TEST_F(StorageServiceTest, Initialize_RebuildsVectorIndexFromDatabase) {
  storage_->commit_version(
      TestUtilities::create_test_version("a.txt", {"alpha text", "beta text"}, embedder_));
  storage_->commit_version(TestUtilities::create_test_version("b.txt", {"gamma text"}, embedder_));

  auto fresh_vectors = std::make_shared<VectorStore>(TEST_DIMENSIONS);
  StorageService restarted(metadata_store_, fresh_vectors);
  restarted.initialize();

  EXPECT_EQ(fresh_vectors->searchable_size(), 3);
}

TEST_F(StorageServiceTest, Initialize_DimensionMismatchIsConfigurationError) {
  auto other_dims = std::make_shared<VectorStore>(TEST_DIMENSIONS * 2);
  StorageService mismatched(metadata_store_, other_dims);

  EXPECT_THROW(mismatched.initialize(), ConfigurationError);
}

TEST_F(StorageServiceTest, RemoveDocument_DropsVectorsAndRows) {
  auto result = storage_->commit_version(
      TestUtilities::create_test_version("a.txt", {"alpha", "beta"}, embedder_));

  auto removed = storage_->remove_document(result.document_id);

  EXPECT_EQ(removed.size(), 2);
  EXPECT_EQ(vector_store_->size(), 0);
  EXPECT_FALSE(metadata_store_->get_document(result.document_id).has_value());
  EXPECT_THROW(storage_->remove_document(result.document_id), NotFoundError);
}

TEST_F(StorageServiceTest, RemoveByOriginPrefix_CountsRemovedDocuments) {
  storage_->commit_version(TestUtilities::create_test_version("src/a.cpp", {"a"}, embedder_));
  storage_->commit_version(TestUtilities::create_test_version("src/b.cpp", {"b"}, embedder_));
  auto kept = storage_->commit_version(
      TestUtilities::create_test_version("docs/c.md", {"c"}, embedder_));

  EXPECT_EQ(storage_->remove_by_origin_prefix(DEFAULT_KNOWLEDGE_BASE, "src/"), 2);
  EXPECT_EQ(storage_->remove_by_origin_prefix(DEFAULT_KNOWLEDGE_BASE, "src/"), 0);

  auto docs = metadata_store_->list_documents();
  ASSERT_EQ(docs.size(), 1);
  EXPECT_EQ(docs[0].id, kept.document_id);
  EXPECT_EQ(vector_store_->size(), 1);
}

TEST_F(StorageServiceTest, PurgeDeleted_RespectsRetention) {
  storage_->commit_version(TestUtilities::create_test_version("a.txt", {"first"}, embedder_));
  storage_->commit_version(TestUtilities::create_test_version("a.txt", {"second"}, embedder_));
  EXPECT_EQ(vector_store_->size(), 2);

  EXPECT_EQ(storage_->purge_deleted(std::chrono::hours(1)), 0);
  EXPECT_EQ(storage_->purge_deleted(std::chrono::hours(-1)), 1);

  EXPECT_EQ(vector_store_->size(), 1);
  EXPECT_EQ(vector_store_->searchable_size(), 1);
}

TEST_F(StorageServiceTest, PurgeDeleted_OverlappingCommitBothSucceed) {
  storage_->commit_version(TestUtilities::create_test_version("a.txt", {"first"}, embedder_));
  storage_->commit_version(TestUtilities::create_test_version("a.txt", {"second"}, embedder_));
  auto fresh = TestUtilities::create_test_version("b.txt", {"fresh notes"}, embedder_);

  CommitResult committed;
  size_t purged = 0;
  std::thread writer;
  std::thread purger;
  auto released = std::chrono::steady_clock::now();
  {
    // The commit takes the SQLite write lock, then waits here for the switch lock
    auto snapshot = storage_->acquire_snapshot();
    writer = std::thread([&]() { EXPECT_NO_THROW(committed = storage_->commit_version(fresh)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    purger = std::thread(
        [&]() { EXPECT_NO_THROW(purged = storage_->purge_deleted(std::chrono::hours(-1))); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    released = std::chrono::steady_clock::now();
  }
  writer.join();
  purger.join();

  EXPECT_LT(std::chrono::steady_clock::now() - released, std::chrono::seconds(2));
  EXPECT_EQ(committed.version, 1);
  EXPECT_EQ(purged, 1);
  EXPECT_EQ(vector_store_->searchable_size(), 2);
  EXPECT_EQ(vector_store_->size(), 2);
}

TEST_F(StorageServiceTest, RemoveDocument_OverlappingCommitBothSucceed) {
  auto doomed = storage_->commit_version(
      TestUtilities::create_test_version("a.txt", {"alpha", "beta"}, embedder_));
  auto fresh = TestUtilities::create_test_version("b.txt", {"fresh notes"}, embedder_);

  CommitResult committed;
  std::vector<int64_t> removed;
  std::thread writer;
  std::thread remover;
  auto released = std::chrono::steady_clock::now();
  {
    auto snapshot = storage_->acquire_snapshot();
    writer = std::thread([&]() { EXPECT_NO_THROW(committed = storage_->commit_version(fresh)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    remover = std::thread(
        [&]() { EXPECT_NO_THROW(removed = storage_->remove_document(doomed.document_id)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    released = std::chrono::steady_clock::now();
  }
  writer.join();
  remover.join();

  EXPECT_LT(std::chrono::steady_clock::now() - released, std::chrono::seconds(2));
  EXPECT_EQ(committed.version, 1);
  EXPECT_EQ(removed.size(), 2);
  EXPECT_EQ(vector_store_->size(), 1);
  EXPECT_EQ(vector_ids("fresh notes").front(), committed.chunk_ids[0]);
}

}  // namespace sift_tests
