#include "sift_core/chunking/token_estimator.hpp"

#include <utf8.h>

#include <stdexcept>

namespace sift_core {

namespace {

int tokens_for(size_t words, size_t bytes) {
  size_t by_words = words * 13 / 10;
  size_t by_bytes = bytes / 4;
  return static_cast<int>(by_words > by_bytes ? by_words : by_bytes);
}

bool is_trail_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

int estimate_tokens(std::string_view text) {
  size_t words = 0;
  bool in_word = false;
  for (char c : text) {
    if (is_space_byte(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return tokens_for(words, text.size());
}

size_t align_to_code_point(std::string_view text, size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  if (!is_trail_byte(text[pos])) {
    return pos;
  }

  // A lead byte is at most three bytes back in valid UTF-8.
  size_t lead = pos;
  while (lead > 0 && pos - lead < 3 && is_trail_byte(text[lead])) {
    --lead;
  }
  auto it = text.begin() + lead;
  try {
    utf8::next(it, text.end());
  } catch (const utf8::exception &) {
    return pos;
  }
  size_t next_boundary = static_cast<size_t>(it - text.begin());
  return next_boundary > pos ? lead : pos;
}

std::string truncate_to_token_budget(std::string_view text, int budget) {
  if (estimate_tokens(text) <= budget) {
    return std::string(text);
  }

  const size_t marker_words = 2;
  if (tokens_for(marker_words, TRUNCATION_MARKER.size()) > budget) {
    throw std::invalid_argument("Token budget " + std::to_string(budget) +
                                " is too small to hold the truncation marker");
  }

  SpanTokenCounter counter(text);
  auto fits = [&](size_t prefix) {
    return tokens_for(counter.words(0, prefix) + marker_words,
                      prefix + TRUNCATION_MARKER.size()) <= budget;
  };

  size_t lo = 0;
  size_t hi = text.size();
  while (lo < hi) {
    size_t mid = lo + (hi - lo + 1) / 2;
    if (fits(mid)) {
      lo = mid;
    } else {
      hi = mid - 1;
    }
  }
  size_t cut = align_to_code_point(text, lo);

  // Prefer a newline, then any whitespace, in the final 20% of the prefix.
  size_t floor = cut - cut / 5;
  size_t preferred = cut;
  for (size_t i = cut; i > floor; --i) {
    if (text[i - 1] == '\n') {
      preferred = i - 1;
      break;
    }
  }
  if (preferred == cut) {
    for (size_t i = cut; i > floor; --i) {
      if (is_space_byte(text[i - 1])) {
        preferred = i - 1;
        break;
      }
    }
  }

  std::string truncated(text.substr(0, preferred));
  truncated.append(TRUNCATION_MARKER);
  return truncated;
}

SpanTokenCounter::SpanTokenCounter(std::string_view text)
    : text_(text), word_starts_(text.size() + 1, 0) {
  for (size_t i = 0; i < text_.size(); ++i) {
    bool starts_word = !is_space_byte(text_[i]) && (i == 0 || is_space_byte(text_[i - 1]));
    word_starts_[i + 1] = word_starts_[i] + (starts_word ? 1 : 0);
  }
}

size_t SpanTokenCounter::words(size_t begin, size_t end) const {
  if (end > text_.size()) {
    end = text_.size();
  }
  if (end <= begin) {
    return 0;
  }
  size_t words = word_starts_[end] - word_starts_[begin];
  // A span starting inside a word still contains a piece of that word.
  if (begin > 0 && !is_space_byte(text_[begin]) && !is_space_byte(text_[begin - 1])) {
    ++words;
  }
  return words;
}

int SpanTokenCounter::estimate(size_t begin, size_t end) const {
  if (end > text_.size()) {
    end = text_.size();
  }
  if (end <= begin) {
    return 0;
  }
  return tokens_for(words(begin, end), end - begin);
}

}  // namespace sift_core
