#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

#include "sift_core/index/vector_index.hpp"
#include "../../common/utilities_test.hpp"

namespace sift_core {

class VectorIndexTest : public sift_tests::TempDirTestBase {
 protected:
  static std::vector<std::vector<float>> axis_vectors() {
    return {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.9f, 0.1f, 0.0f}};
  }
};

TEST_F(VectorIndexTest, PositionsFollowInsertionOrder) {
  VectorIndex index(3, IndexKind::Flat);
  index.add(axis_vectors());

  EXPECT_EQ(index.size(), 4u);
  EXPECT_EQ(index.dimension(), 3u);

  auto neighbors = index.search({0.0f, 0.0f, 1.0f}, 1);
  ASSERT_EQ(neighbors.size(), 1u);
  EXPECT_EQ(neighbors[0].position, 2u);
  EXPECT_FLOAT_EQ(neighbors[0].distance, 0.0f);
}

TEST_F(VectorIndexTest, SearchReturnsClosestFirst) {
  VectorIndex index(3, IndexKind::Flat);
  index.add(axis_vectors());

  auto neighbors = index.search({1.0f, 0.0f, 0.0f}, 3);

  ASSERT_EQ(neighbors.size(), 3u);
  EXPECT_EQ(neighbors[0].position, 0u);
  EXPECT_EQ(neighbors[1].position, 3u);
  EXPECT_LE(neighbors[0].distance, neighbors[1].distance);
  EXPECT_LE(neighbors[1].distance, neighbors[2].distance);
  // Squared L2: (0.1)^2 + (0.1)^2
  EXPECT_NEAR(neighbors[1].distance, 0.02f, 1e-5);
}

TEST_F(VectorIndexTest, SearchClampsKToSize) {
  VectorIndex index(3, IndexKind::Flat);
  index.add(axis_vectors());

  EXPECT_EQ(index.search({1.0f, 1.0f, 1.0f}, 100).size(), 4u);
}

TEST_F(VectorIndexTest, EmptyIndexSearchIsEmpty) {
  VectorIndex index(3, IndexKind::Flat);
  EXPECT_TRUE(index.search({1.0f, 0.0f, 0.0f}, 5).empty());
}

TEST_F(VectorIndexTest, RejectsWrongDimensions) {
  VectorIndex index(3, IndexKind::Flat);

  EXPECT_THROW(index.add({{1.0f, 2.0f}}), VectorIndexError);
  EXPECT_EQ(index.size(), 0u);
  index.add(axis_vectors());
  EXPECT_THROW((void)index.search({1.0f}, 1), VectorIndexError);
  EXPECT_THROW(VectorIndex(0, IndexKind::Flat), VectorIndexError);
}

TEST_F(VectorIndexTest, WriteAndReadKeepVectorsAndKind) {
  auto path = temp_dir_ / "vectors.faiss";
  {
    VectorIndex index(3, IndexKind::Flat);
    index.add(axis_vectors());
    index.write(path);
  }

  VectorIndex loaded = VectorIndex::read(path);

  EXPECT_EQ(loaded.kind(), IndexKind::Flat);
  EXPECT_EQ(loaded.size(), 4u);
  EXPECT_EQ(loaded.dimension(), 3u);
  EXPECT_EQ(loaded.search({0.0f, 1.0f, 0.0f}, 1)[0].position, 1u);
}

TEST_F(VectorIndexTest, HnswIndexRoundTripsKind) {
  auto path = temp_dir_ / "hnsw.faiss";
  VectorIndex index(3, IndexKind::Hnsw);
  index.add(axis_vectors());
  index.write(path);

  VectorIndex loaded = VectorIndex::read(path);

  EXPECT_EQ(loaded.kind(), IndexKind::Hnsw);
  auto neighbors = loaded.search({0.0f, 0.0f, 1.0f}, 2);
  ASSERT_FALSE(neighbors.empty());
  EXPECT_EQ(neighbors[0].position, 2u);
}

TEST_F(VectorIndexTest, ReadingMissingFileThrows) {
  EXPECT_THROW((void)VectorIndex::read(temp_dir_ / "missing.faiss"), VectorIndexError);
}

TEST_F(VectorIndexTest, KindNames) {
  EXPECT_EQ(to_string(IndexKind::Flat), "flat");
  EXPECT_EQ(to_string(IndexKind::Hnsw), "hnsw");
  EXPECT_EQ(index_kind_from_string("hnsw"), IndexKind::Hnsw);
  EXPECT_THROW((void)index_kind_from_string("ivf"), std::invalid_argument);
}

}  // namespace sift_core
