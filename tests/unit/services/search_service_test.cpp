#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "sift_core/chunking/token_estimator.hpp"
#include "sift_core/index/index_store.hpp"
#include "sift_core/services/search_service.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::Throw;

namespace sift_core {

class SearchServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<sift_tests::FakeEmbeddingProvider>();
    texts_ = {
        "Invoice totals are rounded to two decimals before export.",
        "The warehouse scanner uploads pallet counts every hour.",
        "JWT authentication middleware validates the user token on every request.",
        "Quarterly revenue grew in the northern region.",
        "CSS grid layout for the dashboard cards.",
        "Retry the shipment webhook when the carrier times out.",
        "SELECT name FROM customers WHERE active = 1;",
        "The onboarding checklist lists laptop setup steps.",
        "Cache eviction runs nightly on the reporting cluster.",
        "Holiday schedule for the support rota.",
    };
    handle_ = std::make_unique<IndexHandle>(build_handle(texts_));
  }

  IndexHandle build_handle(const std::vector<std::string> &texts) {
    std::vector<std::vector<float>> vectors;
    std::vector<ChunkRecord> records;
    for (size_t i = 0; i < texts.size(); ++i) {
      vectors.push_back(provider_->embed_one(texts[i]));
      records.push_back(ChunkRecord::from_chunk(
          sift_tests::TestUtilities::create_test_chunk(texts[i], "doc" + std::to_string(i) + ".txt", 0)));
    }
    return store_.build(vectors, records);
  }

  std::shared_ptr<sift_tests::FakeEmbeddingProvider> provider_;
  IndexStore store_;
  std::vector<std::string> texts_;
  std::unique_ptr<IndexHandle> handle_;
};

TEST_F(SearchServiceTest, RanksMatchingChunkFirst) {
  SearchService service(provider_);

  auto results = service.query(*handle_, "user authentication", 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].position, 2u);
  EXPECT_EQ(results[0].record.text, texts_[2]);
  EXPECT_EQ(results[0].rank, 1);
  EXPECT_GT(results[0].vector_score, 0.0);
  EXPECT_GT(results[0].lexical_score, 0.0);
}

TEST_F(SearchServiceTest, ResultsAreRankedAndDeterministic) {
  SearchService service(provider_);

  auto first = service.query(*handle_, "shipment carrier webhook", 5);
  auto second = service.query(*handle_, "shipment carrier webhook", 5);

  ASSERT_EQ(first.size(), 5u);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].rank, static_cast<int>(i + 1));
    EXPECT_EQ(first[i].position, second[i].position);
    EXPECT_DOUBLE_EQ(first[i].score, second[i].score);
    if (i > 0) {
      EXPECT_GE(first[i - 1].score, first[i].score);
    }
  }
  EXPECT_EQ(first[0].position, 5u);
}

TEST_F(SearchServiceTest, TopKLargerThanIndexReturnsEverything) {
  SearchService service(provider_);
  EXPECT_EQ(service.query(*handle_, "report", 50).size(), texts_.size());
}

TEST_F(SearchServiceTest, NonPositiveTopKThrows) {
  SearchService service(provider_);
  EXPECT_THROW((void)service.query(*handle_, "anything", 0), SearchServiceError);
  EXPECT_THROW((void)service.query(*handle_, "anything", -3), SearchServiceError);
}

TEST_F(SearchServiceTest, EmptyIndexReturnsNothing) {
  SearchService service(provider_);
  IndexHandle empty{.vectors = VectorIndex(64, IndexKind::Flat), .records = {}, .revision = 0};
  EXPECT_TRUE(service.query(empty, "anything", 5).empty());
}

TEST_F(SearchServiceTest, FallsBackToLexicalWhenEmbeddingFails) {
  auto failing = std::make_shared<sift_tests::MockEmbeddingProvider>();
  EXPECT_CALL(*failing, embed_batch(_))
      .WillOnce(Throw(EmbeddingError(EmbeddingError::Kind::Transient, "connection refused")));
  SearchService service(failing);

  auto results = service.query(*handle_, "pallet counts", 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].position, 1u);
  for (const auto &result : results) {
    EXPECT_EQ(result.vector_score, 0.0);
  }
}

TEST_F(SearchServiceTest, NullProviderRanksLexically) {
  SearchService service(nullptr);

  auto results = service.query(*handle_, "customers active", 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].position, 6u);
  EXPECT_DOUBLE_EQ(results[0].score, 0.5);
}

TEST_F(SearchServiceTest, WrongQueryDimensionFallsBackToLexical) {
  auto provider = std::make_shared<sift_tests::MockEmbeddingProvider>();
  EXPECT_CALL(*provider, embed_batch(_))
      .WillOnce(Invoke([](const std::vector<std::string> &texts) {
        return std::vector<std::vector<float>>(texts.size(), std::vector<float>(3, 1.0f));
      }));
  SearchService service(provider);

  auto results = service.query(*handle_, "dashboard grid layout", 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].position, 4u);
  EXPECT_EQ(results[0].vector_score, 0.0);
}

TEST_F(SearchServiceTest, VectorOnlyWeighting) {
  SearchService service(provider_, RetrievalOptions{.query_token_ceiling = 7000,
                                                    .vector_weight = 1.0,
                                                    .lexical_weight = 0.0});

  auto results = service.query(*handle_, texts_[3], 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].position, 3u);
  // Identical text embeds to the identical vector: distance 0
  EXPECT_DOUBLE_EQ(results[0].vector_score, 1.0);
  EXPECT_DOUBLE_EQ(results[0].score, 1.0);
}

TEST_F(SearchServiceTest, TiesGoToLowerPosition) {
  SearchService service(nullptr);
  IndexHandle handle = build_handle({"same words here", "other text", "same words here", "alpha beta", "gamma delta"});

  auto results = service.query(handle, "same words", 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].position, 0u);
  EXPECT_EQ(results[1].position, 2u);
  EXPECT_DOUBLE_EQ(results[0].score, results[1].score);
  EXPECT_EQ(results[2].position, 1u);
}

TEST_F(SearchServiceTest, NegativeWeightsAreRejected) {
  EXPECT_THROW(SearchService(provider_, RetrievalOptions{.query_token_ceiling = 7000,
                                                         .vector_weight = -0.1,
                                                         .lexical_weight = 1.0}),
               SearchServiceError);
}

TEST_F(SearchServiceTest, LongQueriesAreTruncatedBeforeEmbedding) {
  auto provider = std::make_shared<sift_tests::MockEmbeddingProvider>();
  std::string embedded_text;
  EXPECT_CALL(*provider, embed_batch(_))
      .WillOnce(Invoke([&](const std::vector<std::string> &texts) {
        embedded_text = texts.at(0);
        return std::vector<std::vector<float>>(1, std::vector<float>(64, 0.1f));
      }));
  SearchService service(provider, RetrievalOptions{.query_token_ceiling = 100,
                                                   .vector_weight = 0.5,
                                                   .lexical_weight = 0.5});
  std::string query;
  for (int i = 0; i < 2000; ++i) {
    query += "authentication ";
  }

  auto results = service.query(*handle_, query, 1);

  EXPECT_LE(estimate_tokens(embedded_text), 100);
  EXPECT_THAT(embedded_text, ::testing::EndsWith(std::string(TRUNCATION_MARKER)));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].position, 2u);
}

TEST_F(SearchServiceTest, AppendedEntriesAreSearchable) {
  SearchService service(nullptr);
  IndexHandle handle = build_handle({"alpha text", "beta text"});
  auto before = service.query(handle, "zebra", 1);
  ASSERT_EQ(before.size(), 1u);
  EXPECT_EQ(before[0].lexical_score, 0.0);

  store_.append(handle, {provider_->embed_one("zebra crossing")},
                {ChunkRecord::from_chunk(sift_tests::TestUtilities::create_test_chunk("zebra crossing"))});
  auto after = service.query(handle, "zebra", 1);

  ASSERT_EQ(after.size(), 1u);
  EXPECT_EQ(after[0].position, 2u);
  EXPECT_GT(after[0].lexical_score, 0.0);
}

}  // namespace sift_core
