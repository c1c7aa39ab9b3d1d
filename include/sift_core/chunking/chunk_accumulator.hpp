#pragma once

#include <vector>

#include "sift_core/chunking/chunk_strategy.hpp"

namespace sift_core {

/**
 * @class ChunkAccumulator
 * @brief Grows chunks out of contiguous units and seeds overlap on close.
 *
 * Units must be fed in text order without gaps. After close(), the next chunk
 * starts with the trailing lines of the closed chunk whose estimate is within
 * min(overlap_tokens, target_tokens / 2). When the whole closed chunk fits,
 * the whole chunk becomes the overlap.
 */
class ChunkAccumulator {
 public:
  ChunkAccumulator(const SpanTokenCounter &counter, const ChunkBudget &budget);

  // Estimate of the open chunk if it were extended through unit.
  int tokens_with(const TextSpan &unit);

  // True once the open chunk holds bytes beyond its overlap.
  bool has_new_content() const;

  void add(const TextSpan &unit);
  void close();

  // Removes the non-overlap content from the open chunk and returns it.
  TextSpan take_new_content();

  std::vector<ChunkSpan> finish();

 private:
  void open_at(size_t pos);

  const SpanTokenCounter &counter_;
  int target_tokens_;
  int overlap_budget_;
  bool open_ = false;
  size_t chunk_begin_ = 0;
  size_t content_begin_ = 0;
  size_t cursor_ = 0;
  std::vector<ChunkSpan> chunks_;
};

// Line spans of [begin, end); each line keeps its trailing '\n'.
std::vector<TextSpan> line_spans(std::string_view text, size_t begin, size_t end);

// Splits one over-budget span into pieces within target_tokens, cutting at
// whitespace in the last fifth of a piece when possible and never inside a
// UTF-8 code point.
std::vector<TextSpan> split_into_pieces(const SpanTokenCounter &counter,
                                        size_t begin,
                                        size_t end,
                                        int target_tokens);

// Forced split units: raw lines, with over-budget lines broken into pieces.
std::vector<TextSpan> forced_units(const SpanTokenCounter &counter,
                                   size_t begin,
                                   size_t end,
                                   int target_tokens);

// Accumulates structural units up to the budget. Units over budget on their
// own are replaced by their forced split units.
std::vector<ChunkSpan> accumulate_units(const SpanTokenCounter &counter,
                                        const std::vector<TextSpan> &units,
                                        const ChunkBudget &budget);

}  // namespace sift_core
