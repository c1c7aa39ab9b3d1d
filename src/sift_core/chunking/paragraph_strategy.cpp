#include "sift_core/chunking/paragraph_strategy.hpp"

#include "sift_core/chunking/chunk_accumulator.hpp"

namespace sift_core {

ParagraphStrategy::ParagraphStrategy()
    : blank_line_regex_(R"(\n\s*\n)", std::regex_constants::ECMAScript) {}

bool ParagraphStrategy::has_markers(std::string_view text) const {
  return std::regex_search(text.begin(), text.end(), blank_line_regex_);
}

std::vector<ChunkSpan> ParagraphStrategy::split(const SpanTokenCounter &counter,
                                                const ChunkBudget &budget) const {
  std::string_view text = counter.text();
  std::vector<TextSpan> paragraphs;
  size_t paragraph_begin = 0;
  for (auto it = std::cregex_iterator(text.data(), text.data() + text.size(), blank_line_regex_);
       it != std::cregex_iterator(); ++it) {
    size_t separator_end = static_cast<size_t>(it->position() + it->length());
    paragraphs.push_back({paragraph_begin, separator_end});
    paragraph_begin = separator_end;
  }
  if (paragraph_begin < text.size()) {
    paragraphs.push_back({paragraph_begin, text.size()});
  }
  return accumulate_units(counter, paragraphs, budget);
}

std::vector<ChunkSpan> LineStrategy::split(const SpanTokenCounter &counter,
                                           const ChunkBudget &budget) const {
  return accumulate_units(counter, line_spans(counter.text(), 0, counter.size()), budget);
}

}  // namespace sift_core
