#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sift_core/extractors/document_extractor_factory.hpp"
#include "sift_core/services/indexing_service.hpp"
#include "sift_core/services/search_service.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

using ::testing::HasSubstr;

namespace sift_core {

class IndexingServiceTest : public sift_tests::TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    provider_ = std::make_shared<sift_tests::FakeEmbeddingProvider>();
    checkpoints_ = std::make_shared<CheckpointStore>(temp_dir_ / "checkpoints");
    options_.target_tokens = 50;
    options_.overlap_tokens = 10;
    options_.index_path = temp_dir_ / "index" / "sift.faiss";
    // One 40-50 token chunk per batch
    batching_.batch_token_budget = 60;
    service_ = make_service();
  }

  std::unique_ptr<IndexingService> make_service() {
    return std::make_unique<IndexingService>(provider_, checkpoints_, IndexStore(), options_, batching_,
                                             RetryPolicy{}, [](std::chrono::milliseconds) {});
  }

  static std::vector<Document> service_documents() {
    return {make_document(sift_tests::TestUtilities::csharp_service_source(), "Service.cs", DocumentType::Code)};
  }

  size_t planned_batches(const std::vector<Document> &documents) {
    EmbeddingBatcher planner(*provider_, *checkpoints_, batching_);
    return planner.plan_batches(service_->chunk_documents(documents)).size();
  }

  std::shared_ptr<sift_tests::FakeEmbeddingProvider> provider_;
  std::shared_ptr<CheckpointStore> checkpoints_;
  IndexingOptions options_;
  BatchingOptions batching_;
  std::unique_ptr<IndexingService> service_;
};

TEST_F(IndexingServiceTest, BuildIndexesEveryChunkAndSavesIt) {
  auto documents = service_documents();
  documents.push_back(make_manual_note("Remember to rotate the API keys every quarter."));
  const size_t expected_chunks = service_->chunk_documents(documents).size();

  IndexHandle handle = service_->build(documents);

  EXPECT_EQ(handle.size(), expected_chunks);
  EXPECT_EQ(handle.vectors.size(), expected_chunks);
  EXPECT_EQ(handle.records.back().source_id, "Manual Note");
  EXPECT_EQ(handle.records.back().type, DocumentType::ManualNote);
  EXPECT_TRUE(std::filesystem::exists(options_.index_path));
  EXPECT_TRUE(std::filesystem::exists(IndexStore::metadata_path_for(options_.index_path)));
  EXPECT_FALSE(checkpoints_->exists(IndexingService::BUILD_CHECKPOINT));

  IndexHandle loaded = IndexStore().load(options_.index_path);
  EXPECT_EQ(loaded.size(), expected_chunks);
}

TEST_F(IndexingServiceTest, ChunkDocumentsSkipsBlankDocuments) {
  std::vector<Document> documents = {
      make_document("   \n\t\n", "blank.txt", DocumentType::GenericText),
      make_document("", "empty.md", DocumentType::GenericText),
      make_document("real content", "real.txt", DocumentType::GenericText),
  };

  auto chunks = service_->chunk_documents(documents);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].source_id, "real.txt");
}

TEST_F(IndexingServiceTest, BuildWithoutContentFails) {
  std::vector<Document> documents = {make_document("  \n", "blank.txt", DocumentType::GenericText)};

  EXPECT_THROW((void)service_->build(documents), IndexingJobError);
  EXPECT_FALSE(std::filesystem::exists(options_.index_path));
  EXPECT_EQ(provider_->calls(), 0);
}

TEST_F(IndexingServiceTest, FailedBuildKeepsCheckpointAndResumes) {
  auto documents = service_documents();
  const size_t batches = planned_batches(documents);
  ASSERT_GE(batches, 2u);

  provider_->fail_after(1);
  try {
    (void)service_->build(documents);
    FAIL() << "Expected IndexingJobError";
  } catch (const IndexingJobError &e) {
    EXPECT_THAT(e.what(), HasSubstr("Build failed"));
    EXPECT_THAT(e.what(), HasSubstr("Checkpoint saved at"));
    EXPECT_THAT(e.what(), HasSubstr("Run again to resume."));
    EXPECT_EQ(e.checkpoint_location(), checkpoints_->location(IndexingService::BUILD_CHECKPOINT));
  }
  EXPECT_TRUE(checkpoints_->exists(IndexingService::BUILD_CHECKPOINT));
  EXPECT_FALSE(std::filesystem::exists(options_.index_path));
  const int calls_after_failure = provider_->calls();

  provider_->stop_failing();
  IndexHandle handle = service_->build(documents);

  // Only the batches that were not checkpointed are embedded again.
  EXPECT_EQ(provider_->calls() - calls_after_failure, static_cast<int>(batches) - 1);
  EXPECT_EQ(handle.size(), service_->chunk_documents(documents).size());
  EXPECT_FALSE(checkpoints_->exists(IndexingService::BUILD_CHECKPOINT));
}

TEST_F(IndexingServiceTest, ResumedBuildMatchesUninterruptedBuild) {
  auto documents = service_documents();
  IndexHandle clean = service_->build(documents);

  auto other_dir = temp_dir_ / "second";
  options_.index_path = other_dir / "sift.faiss";
  checkpoints_ = std::make_shared<CheckpointStore>(other_dir / "checkpoints");
  service_ = make_service();
  provider_->fail_after(1, EmbeddingError::Kind::Fatal);
  EXPECT_THROW((void)service_->build(documents), IndexingJobError);
  provider_->stop_failing();
  IndexHandle resumed = service_->build(documents);

  ASSERT_EQ(resumed.size(), clean.size());
  for (size_t i = 0; i < clean.size(); ++i) {
    EXPECT_EQ(resumed.records[i].text, clean.records[i].text);
    auto query = provider_->embed_one(clean.records[i].text);
    EXPECT_EQ(resumed.vectors.search(query, 1)[0].position, clean.vectors.search(query, 1)[0].position);
  }
}

TEST_F(IndexingServiceTest, AppendExtendsSavedIndex) {
  IndexHandle built = service_->build(service_documents());
  std::vector<Document> more = {make_manual_note("Deploys are frozen during the audit week.")};

  IndexHandle appended = service_->append(more);

  ASSERT_EQ(appended.size(), built.size() + 1);
  for (size_t i = 0; i < built.size(); ++i) {
    EXPECT_EQ(appended.records[i].text, built.records[i].text);
  }
  EXPECT_EQ(appended.records.back().text, "Deploys are frozen during the audit week.");
  EXPECT_EQ(IndexStore().load(options_.index_path).size(), appended.size());
  EXPECT_FALSE(checkpoints_->exists(IndexingService::APPEND_CHECKPOINT));
}

TEST_F(IndexingServiceTest, AppendWithoutSavedIndexFails) {
  try {
    (void)service_->append({make_manual_note("orphan note")});
    FAIL() << "Expected IndexingJobError";
  } catch (const IndexingJobError &e) {
    EXPECT_THAT(e.what(), HasSubstr("Append failed"));
    EXPECT_THAT(e.what(), ::testing::Not(HasSubstr("Checkpoint saved at")));
  }
}

TEST_F(IndexingServiceTest, AppendingNothingKeepsIndex) {
  IndexHandle built = service_->build(service_documents());

  IndexHandle unchanged = service_->append({make_document(" ", "blank.txt", DocumentType::GenericText)});

  EXPECT_EQ(unchanged.size(), built.size());
}

TEST_F(IndexingServiceTest, CancelledBuildFails) {
  service_->request_cancel();

  EXPECT_THROW((void)service_->build(service_documents()), IndexingJobError);
  EXPECT_EQ(provider_->calls(), 0);
  EXPECT_TRUE(checkpoints_->exists(IndexingService::BUILD_CHECKPOINT));
}

TEST_F(IndexingServiceTest, BuildAfterCancelledBuildSucceeds) {
  const auto documents = service_documents();
  service_->request_cancel();
  EXPECT_THROW((void)service_->build(documents), IndexingJobError);

  IndexHandle handle = service_->build(documents);

  EXPECT_EQ(handle.size(), service_->chunk_documents(documents).size());
  EXPECT_GT(provider_->calls(), 0);
  EXPECT_FALSE(checkpoints_->exists(IndexingService::BUILD_CHECKPOINT));
}

TEST_F(IndexingServiceTest, BuiltIndexAnswersQueries) {
  auto documents = service_documents();
  documents.push_back(make_manual_note("Password reset emails expire after thirty minutes."));
  IndexHandle handle = service_->build(documents);
  SearchService search(provider_);

  auto results = search.query(handle, "password reset expire", 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].record.source_id, "Manual Note");
}

TEST_F(IndexingServiceTest, BuildsFromDirectoryOfFiles) {
  auto input = temp_dir_ / "input";
  sift_tests::TestUtilities::write_file(input / "src" / "Service.cs", sift_tests::TestUtilities::csharp_service_source());
  sift_tests::TestUtilities::write_file(input / "docs" / "readme.md", "# Readme\n\nHow to run the service.\n");
  sift_tests::TestUtilities::write_file(input / "data" / "orders.csv", "id,total\n1,10\n2,20\n");
  DocumentExtractorFactory factory;

  auto documents = factory.read_directory(input);
  IndexHandle handle = service_->build(documents);

  ASSERT_EQ(documents.size(), 3u);
  EXPECT_GE(handle.size(), 4u);
}

}  // namespace sift_core
