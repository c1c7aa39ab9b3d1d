#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sift_core {

inline constexpr std::string_view TRUNCATION_MARKER = "\n... [truncated]";

inline bool is_space_byte(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// max(words * 1.3, bytes / 4) in integer arithmetic. Words are maximal runs
// of non-whitespace bytes. Monotonic over prefixes.
int estimate_tokens(std::string_view text);

// Returns text unchanged when it fits the budget. Otherwise returns a prefix
// plus TRUNCATION_MARKER whose estimate is within budget, cut at a newline or
// whitespace in the last fifth of the prefix when one exists.
std::string truncate_to_token_budget(std::string_view text, int budget);

// Largest UTF-8 code point boundary <= pos. Invalid sequences are cut at pos.
size_t align_to_code_point(std::string_view text, size_t pos);

/**
 * @class SpanTokenCounter
 * @brief Exact estimate_tokens() of any [begin, end) span of one text in O(1).
 *
 * Keeps a prefix count of word starts so the chunker can measure candidate
 * chunks on their real text instead of summing per-line estimates. The
 * counter does not own the text; it must outlive the counter.
 */
class SpanTokenCounter {
 public:
  explicit SpanTokenCounter(std::string_view text);

  int estimate(size_t begin, size_t end) const;
  size_t words(size_t begin, size_t end) const;

  std::string_view text() const {
    return text_;
  }
  size_t size() const {
    return text_.size();
  }

 private:
  std::string_view text_;
  std::vector<size_t> word_starts_;
};

}  // namespace sift_core
