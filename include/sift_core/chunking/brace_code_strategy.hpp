#pragma once

#include <regex>

#include "sift_core/chunking/chunk_strategy.hpp"

namespace sift_core {

/**
 * @class BraceCodeStrategy
 * @brief Line-based chunking for C#, TypeScript and JavaScript sources.
 *
 * Tracks brace depth and the depth outside the last class or method
 * signature, whether its brace is on the signature line or the next one. Once
 * a chunk is over target_tokens it only closes where depth is back at the top
 * level, or back at that recorded depth after the body has opened. A chunk that grows past
 * 2 x target_tokens without reaching such a boundary has its new content
 * re-chunked by raw lines.
 */
class BraceCodeStrategy : public ChunkStrategy {
 public:
  BraceCodeStrategy();

  ContentKind kind() const override {
    return ContentKind::BraceCode;
  }
  bool has_markers(std::string_view text) const override;
  std::vector<ChunkSpan> split(const SpanTokenCounter &counter,
                               const ChunkBudget &budget) const override;

 private:
  std::regex signature_regex_;
};

}  // namespace sift_core
