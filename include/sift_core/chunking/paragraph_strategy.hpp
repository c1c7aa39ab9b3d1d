#pragma once

#include <regex>

#include "sift_core/chunking/chunk_strategy.hpp"

namespace sift_core {

// Accumulates blank-line separated paragraphs up to the budget.
class ParagraphStrategy : public ChunkStrategy {
 public:
  ParagraphStrategy();

  ContentKind kind() const override {
    return ContentKind::Paragraphs;
  }
  bool has_markers(std::string_view text) const override;
  std::vector<ChunkSpan> split(const SpanTokenCounter &counter,
                               const ChunkBudget &budget) const override;

 private:
  std::regex blank_line_regex_;
};

// Raw lines; the last strategy in the chain, so it always applies.
class LineStrategy : public ChunkStrategy {
 public:
  ContentKind kind() const override {
    return ContentKind::Lines;
  }
  bool has_markers(std::string_view) const override {
    return true;
  }
  std::vector<ChunkSpan> split(const SpanTokenCounter &counter,
                               const ChunkBudget &budget) const override;
};

}  // namespace sift_core
