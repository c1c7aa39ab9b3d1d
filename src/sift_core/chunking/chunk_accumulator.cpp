#include "sift_core/chunking/chunk_accumulator.hpp"

#include <algorithm>

namespace sift_core {

ChunkAccumulator::ChunkAccumulator(const SpanTokenCounter &counter, const ChunkBudget &budget)
    : counter_(counter),
      target_tokens_(budget.target_tokens),
      overlap_budget_(std::min(budget.overlap_tokens, budget.target_tokens / 2)) {}

void ChunkAccumulator::open_at(size_t pos) {
  open_ = true;
  chunk_begin_ = pos;
  content_begin_ = pos;
  cursor_ = pos;
}

int ChunkAccumulator::tokens_with(const TextSpan &unit) {
  if (!open_) {
    open_at(unit.begin);
  }
  return counter_.estimate(chunk_begin_, unit.end);
}

bool ChunkAccumulator::has_new_content() const {
  return open_ && cursor_ > content_begin_;
}

void ChunkAccumulator::add(const TextSpan &unit) {
  if (!open_) {
    open_at(unit.begin);
  }
  if (unit.begin != cursor_ || unit.end < unit.begin) {
    throw ChunkingError("Chunk unit [" + std::to_string(unit.begin) + ", " +
                        std::to_string(unit.end) + ") does not continue at byte " +
                        std::to_string(cursor_));
  }
  cursor_ = unit.end;
}

void ChunkAccumulator::close() {
  if (!has_new_content()) {
    return;
  }
  chunks_.push_back({chunk_begin_, content_begin_, cursor_});

  std::string_view text = counter_.text();
  size_t overlap_begin = cursor_;
  if (overlap_budget_ > 0) {
    size_t line_end = cursor_;
    while (line_end > chunk_begin_) {
      size_t line_begin = line_end - 1;
      while (line_begin > chunk_begin_ && text[line_begin - 1] != '\n') {
        --line_begin;
      }
      if (counter_.estimate(line_begin, cursor_) > overlap_budget_) {
        break;
      }
      overlap_begin = line_begin;
      line_end = line_begin;
    }
  }

  chunk_begin_ = overlap_begin;
  content_begin_ = cursor_;
}

TextSpan ChunkAccumulator::take_new_content() {
  TextSpan pending{content_begin_, cursor_};
  cursor_ = content_begin_;
  return pending;
}

std::vector<ChunkSpan> ChunkAccumulator::finish() {
  if (has_new_content()) {
    chunks_.push_back({chunk_begin_, content_begin_, cursor_});
    content_begin_ = cursor_;
  }
  return std::move(chunks_);
}

std::vector<TextSpan> line_spans(std::string_view text, size_t begin, size_t end) {
  std::vector<TextSpan> lines;
  size_t line_begin = begin;
  for (size_t i = begin; i < end; ++i) {
    if (text[i] == '\n') {
      lines.push_back({line_begin, i + 1});
      line_begin = i + 1;
    }
  }
  if (line_begin < end) {
    lines.push_back({line_begin, end});
  }
  return lines;
}

std::vector<TextSpan> split_into_pieces(const SpanTokenCounter &counter,
                                        size_t begin,
                                        size_t end,
                                        int target_tokens) {
  std::vector<TextSpan> pieces;
  std::string_view text = counter.text();

  while (begin < end) {
    if (counter.estimate(begin, end) <= target_tokens) {
      pieces.push_back({begin, end});
      break;
    }

    // Largest prefix within budget; one byte always fits a positive budget.
    size_t lo = begin + 1;
    size_t hi = end;
    while (lo < hi) {
      size_t mid = lo + (hi - lo + 1) / 2;
      if (counter.estimate(begin, mid) <= target_tokens) {
        lo = mid;
      } else {
        hi = mid - 1;
      }
    }

    size_t cut = align_to_code_point(text, lo);
    size_t floor = cut - (cut - begin) / 5;
    for (size_t i = cut; i > floor && i > begin + 1; --i) {
      if (is_space_byte(text[i - 1])) {
        cut = i;
        break;
      }
    }
    if (cut <= begin) {
      throw ChunkingError("Forced split made no progress at byte " + std::to_string(begin));
    }

    pieces.push_back({begin, cut});
    begin = cut;
  }
  return pieces;
}

std::vector<TextSpan> forced_units(const SpanTokenCounter &counter,
                                   size_t begin,
                                   size_t end,
                                   int target_tokens) {
  std::vector<TextSpan> units;
  for (const auto &line : line_spans(counter.text(), begin, end)) {
    if (counter.estimate(line.begin, line.end) > target_tokens) {
      auto pieces = split_into_pieces(counter, line.begin, line.end, target_tokens);
      units.insert(units.end(), pieces.begin(), pieces.end());
    } else {
      units.push_back(line);
    }
  }
  return units;
}

std::vector<ChunkSpan> accumulate_units(const SpanTokenCounter &counter,
                                        const std::vector<TextSpan> &units,
                                        const ChunkBudget &budget) {
  ChunkAccumulator accumulator(counter, budget);
  for (const auto &unit : units) {
    std::vector<TextSpan> parts;
    if (counter.estimate(unit.begin, unit.end) > budget.target_tokens) {
      parts = forced_units(counter, unit.begin, unit.end, budget.target_tokens);
    } else {
      parts.push_back(unit);
    }

    for (const auto &part : parts) {
      if (accumulator.tokens_with(part) > budget.target_tokens && accumulator.has_new_content()) {
        accumulator.close();
      }
      accumulator.add(part);
    }
  }
  return accumulator.finish();
}

}  // namespace sift_core
