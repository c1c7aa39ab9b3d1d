#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "sift_core/search/lexical_index.hpp"

namespace sift_core {

class LexicalIndexTest : public ::testing::Test {
 protected:
  LexicalIndex index_{std::vector<std::string>{"the cat sat", "the dog ran", "a bird flew"}};
};

TEST_F(LexicalIndexTest, TokenizeLowercasesWordRuns) {
  EXPECT_THAT(LexicalIndex::tokenize("Hello, World_42! caf\xC3\xA9 x-y"),
              ::testing::ElementsAre("hello", "world_42", "caf\xC3\xA9", "x", "y"));
  EXPECT_TRUE(LexicalIndex::tokenize("  ,;:  ").empty());
}

TEST_F(LexicalIndexTest, RareTermsWeighMore) {
  const double cat = index_.idf("cat");
  EXPECT_NEAR(cat, std::log(2.5) - std::log(1.5), 1e-12);
  // "the" appears in two of three documents: its negative idf is floored
  EXPECT_GT(index_.idf("the"), 0.0);
  EXPECT_LT(index_.idf("the"), cat);
}

TEST_F(LexicalIndexTest, UnknownTermsScoreNothing) {
  EXPECT_EQ(index_.idf("zebra"), 0.0);
  EXPECT_THAT(index_.scores("zebra"), ::testing::Each(0.0));
}

TEST_F(LexicalIndexTest, ScoresOnlyMatchingDocuments) {
  auto scores = index_.scores("cat");

  ASSERT_EQ(scores.size(), 3u);
  // Equal-length documents: tf 1 gives exactly idf
  EXPECT_NEAR(scores[0], index_.idf("cat"), 1e-12);
  EXPECT_EQ(scores[1], 0.0);
  EXPECT_EQ(scores[2], 0.0);
}

TEST_F(LexicalIndexTest, QueryIsCaseInsensitive) {
  EXPECT_EQ(index_.scores("CAT Dog"), index_.scores("cat dog"));
}

TEST_F(LexicalIndexTest, ShorterDocumentsWinOnEqualFrequency) {
  LexicalIndex index(std::vector<std::string>{
      "token refresh",
      "token refresh handled after many other unrelated words in this long document body",
      "nothing relevant here",
  });

  auto scores = index.scores("token");

  EXPECT_GT(scores[0], scores[1]);
  EXPECT_GT(scores[1], 0.0);
}

TEST_F(LexicalIndexTest, EmptyCorpus) {
  LexicalIndex empty(std::vector<std::string>{});
  EXPECT_EQ(empty.size(), 0u);
  EXPECT_TRUE(empty.scores("anything").empty());
}

TEST_F(LexicalIndexTest, SizeMatchesCorpus) {
  EXPECT_EQ(index_.size(), 3u);
}

}  // namespace sift_core
