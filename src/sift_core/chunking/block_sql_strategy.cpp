#include "sift_core/chunking/block_sql_strategy.hpp"

#include <iterator>

#include "sift_core/chunking/chunk_accumulator.hpp"

namespace sift_core {

namespace {

int count_matches(std::string_view line, const std::regex &re) {
  return static_cast<int>(std::distance(
      std::cregex_iterator(line.data(), line.data() + line.size(), re), std::cregex_iterator()));
}

}  // namespace

BlockSqlStrategy::BlockSqlStrategy()
    : create_regex_(
          R"(^[ \t]*CREATE\s+(OR\s+(ALTER|REPLACE)\s+)?(PROCEDURE|PROC|FUNCTION|TRIGGER|VIEW)\b)",
          std::regex_constants::ECMAScript | std::regex_constants::icase |
              std::regex_constants::multiline),
      begin_regex_(R"(\bBEGIN\b)", std::regex_constants::ECMAScript | std::regex_constants::icase),
      end_regex_(R"(\bEND\b)", std::regex_constants::ECMAScript | std::regex_constants::icase) {}

bool BlockSqlStrategy::has_markers(std::string_view text) const {
  if (text.find(';') != std::string_view::npos) {
    return true;
  }
  return std::regex_search(text.begin(), text.end(), create_regex_);
}

std::vector<TextSpan> BlockSqlStrategy::block_units(std::string_view text) const {
  std::vector<size_t> starts;
  for (auto it = std::cregex_iterator(text.data(), text.data() + text.size(), create_regex_);
       it != std::cregex_iterator(); ++it) {
    starts.push_back(static_cast<size_t>(it->position()));
  }

  std::vector<TextSpan> units;
  if (starts.empty()) {
    return units;
  }
  // Preamble before the first CREATE (comments, USE, SET options).
  if (starts.front() > 0) {
    units.push_back({0, starts.front()});
  }
  for (size_t i = 0; i < starts.size(); ++i) {
    size_t end = i + 1 < starts.size() ? starts[i + 1] : text.size();
    units.push_back({starts[i], end});
  }
  return units;
}

std::vector<TextSpan> BlockSqlStrategy::begin_end_units(std::string_view text,
                                                        const TextSpan &span) const {
  std::vector<TextSpan> units;
  int depth = 0;
  size_t unit_begin = span.begin;
  for (const auto &line : line_spans(text, span.begin, span.end)) {
    std::string_view line_text = text.substr(line.begin, line.end - line.begin);
    depth += count_matches(line_text, begin_regex_);
    depth -= count_matches(line_text, end_regex_);
    if (depth <= 0) {
      units.push_back({unit_begin, line.end});
      unit_begin = line.end;
      depth = 0;
    }
  }
  if (unit_begin < span.end) {
    units.push_back({unit_begin, span.end});
  }
  return units;
}

std::vector<TextSpan> BlockSqlStrategy::statement_units(std::string_view text,
                                                        const TextSpan &span) const {
  std::vector<TextSpan> units;
  size_t unit_begin = span.begin;
  size_t i = span.begin;
  while (i < span.end) {
    if (text[i] != ';') {
      ++i;
      continue;
    }
    // Keep the terminator, trailing blanks and the line break with the statement.
    size_t end = i + 1;
    while (end < span.end && (text[end] == ' ' || text[end] == '\t' || text[end] == '\r')) {
      ++end;
    }
    if (end < span.end && text[end] == '\n') {
      ++end;
    }
    units.push_back({unit_begin, end});
    unit_begin = end;
    i = end;
  }
  if (unit_begin < span.end) {
    units.push_back({unit_begin, span.end});
  }
  return units;
}

std::vector<ChunkSpan> BlockSqlStrategy::split(const SpanTokenCounter &counter,
                                               const ChunkBudget &budget) const {
  std::string_view text = counter.text();
  const int target = budget.target_tokens;

  auto over_budget = [&](const TextSpan &span) {
    return counter.estimate(span.begin, span.end) > target;
  };
  auto split_statements = [&](const TextSpan &span, std::vector<TextSpan> &out) {
    for (const auto &statement : statement_units(text, span)) {
      out.push_back(statement);
    }
  };

  std::vector<TextSpan> blocks = block_units(text);
  std::vector<TextSpan> units;
  if (blocks.empty()) {
    split_statements({0, text.size()}, units);
    return accumulate_units(counter, units, budget);
  }

  for (const auto &block : blocks) {
    if (!over_budget(block)) {
      units.push_back(block);
      continue;
    }
    for (const auto &nested : begin_end_units(text, block)) {
      if (over_budget(nested)) {
        split_statements(nested, units);
      } else {
        units.push_back(nested);
      }
    }
  }
  return accumulate_units(counter, units, budget);
}

}  // namespace sift_core
