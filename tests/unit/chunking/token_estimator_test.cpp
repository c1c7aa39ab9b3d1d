#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "sift_core/chunking/token_estimator.hpp"

namespace sift_core {

TEST(TokenEstimatorTest, EmptyTextIsZero) {
  EXPECT_EQ(estimate_tokens(""), 0);
}

TEST(TokenEstimatorTest, UsesWordCountForShortWords) {
  // 10 words -> 13 tokens; 19 bytes -> 4
  EXPECT_EQ(estimate_tokens("a b c d e f g h i j"), 13);
}

TEST(TokenEstimatorTest, UsesByteCountForLongWords) {
  EXPECT_EQ(estimate_tokens(std::string(400, 'x')), 100);
}

TEST(TokenEstimatorTest, WhitespaceOnlyCountsBytes) {
  EXPECT_EQ(estimate_tokens(std::string(40, ' ')), 10);
  EXPECT_EQ(estimate_tokens("\n\n\t"), 0);
}

TEST(TokenEstimatorTest, MonotonicOverPrefixes) {
  std::string text = "public void Run() {\n  int count = 0;\n  count++;\n}\n";
  int previous = 0;
  for (size_t n = 0; n <= text.size(); ++n) {
    int current = estimate_tokens(text.substr(0, n));
    EXPECT_GE(current, previous) << "prefix length " << n;
    previous = current;
  }
}

TEST(TokenEstimatorTest, SpanCounterMatchesEstimateForEverySpan) {
  std::string text = "alpha beta\n  gamma_delta(epsilon);\n\nzeta  eta theta";
  SpanTokenCounter counter(text);
  for (size_t begin = 0; begin <= text.size(); ++begin) {
    for (size_t end = begin; end <= text.size(); ++end) {
      ASSERT_EQ(counter.estimate(begin, end), estimate_tokens(text.substr(begin, end - begin)))
          << "span [" << begin << ", " << end << ")";
    }
  }
}

TEST(TokenEstimatorTest, SpanCounterCountsPartialWordAtStart) {
  SpanTokenCounter counter("hello world");
  EXPECT_EQ(counter.words(0, 11), 2u);
  EXPECT_EQ(counter.words(2, 8), 2u);
  EXPECT_EQ(counter.words(6, 11), 1u);
  EXPECT_EQ(counter.words(5, 5), 0u);
}

TEST(TokenEstimatorTest, TruncateLeavesFittingTextAlone) {
  std::string text = "short text that fits";
  EXPECT_EQ(truncate_to_token_budget(text, 100), text);
}

TEST(TokenEstimatorTest, TruncateFitsBudgetAndKeepsPrefix) {
  std::string text;
  for (int i = 0; i < 1000; ++i) {
    text += "word ";
  }

  std::string truncated = truncate_to_token_budget(text, 100);

  EXPECT_LE(estimate_tokens(truncated), 100);
  ASSERT_GT(truncated.size(), TRUNCATION_MARKER.size());
  EXPECT_EQ(truncated.substr(truncated.size() - TRUNCATION_MARKER.size()), std::string(TRUNCATION_MARKER));
  std::string kept = truncated.substr(0, truncated.size() - TRUNCATION_MARKER.size());
  EXPECT_EQ(text.compare(0, kept.size(), kept), 0);
  // Cut on a word boundary
  EXPECT_EQ(kept.substr(kept.size() - 4), "word");
}

TEST(TokenEstimatorTest, TruncatePrefersNewline) {
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += "one two three four five six\n";
  }

  std::string truncated = truncate_to_token_budget(text, 50);
  std::string kept = truncated.substr(0, truncated.size() - TRUNCATION_MARKER.size());

  EXPECT_LE(estimate_tokens(truncated), 50);
  EXPECT_EQ(kept.back(), 'x');  // "... six" ends the last whole line
}

TEST(TokenEstimatorTest, TruncateNeverSplitsUtf8CodePoint) {
  std::string text;
  for (int i = 0; i < 1000; ++i) {
    text += "\xC3\xA9";  // e acute
  }

  std::string truncated = truncate_to_token_budget(text, 100);
  std::string kept = truncated.substr(0, truncated.size() - TRUNCATION_MARKER.size());

  EXPECT_LE(estimate_tokens(truncated), 100);
  EXPECT_EQ(kept.size() % 2, 0u);
  EXPECT_FALSE(kept.empty());
}

TEST(TokenEstimatorTest, TruncateRejectsBudgetBelowMarker) {
  std::string text(400, 'x');
  EXPECT_THROW((void)truncate_to_token_budget(text, 3), std::invalid_argument);
}

TEST(TokenEstimatorTest, AlignToCodePoint) {
  std::string text = "a\xC3\xA9" "b";
  EXPECT_EQ(align_to_code_point(text, 0), 0u);
  EXPECT_EQ(align_to_code_point(text, 1), 1u);
  EXPECT_EQ(align_to_code_point(text, 2), 1u);
  EXPECT_EQ(align_to_code_point(text, 3), 3u);
  EXPECT_EQ(align_to_code_point(text, 99), text.size());
}

}  // namespace sift_core
