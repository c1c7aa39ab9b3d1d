#include "sift_core/chunking/brace_code_strategy.hpp"

#include <algorithm>
#include <optional>

#include "sift_core/chunking/chunk_accumulator.hpp"

namespace sift_core {

BraceCodeStrategy::BraceCodeStrategy()
    : signature_regex_(
          R"((public|private|protected|export|async)\s+(class|interface|function|async|[\w<>]+)\s+\w+\s*(?:[({:]|$))",
          std::regex_constants::ECMAScript | std::regex_constants::optimize) {}

bool BraceCodeStrategy::has_markers(std::string_view text) const {
  return text.find('{') != std::string_view::npos;
}

std::vector<ChunkSpan> BraceCodeStrategy::split(const SpanTokenCounter &counter,
                                                const ChunkBudget &budget) const {
  std::string_view text = counter.text();
  const int target = budget.target_tokens;

  ChunkAccumulator accumulator(counter, budget);
  int depth = 0;
  // Depth outside the last signature; a boundary once its body has opened and closed.
  std::optional<int> method_start_depth;
  bool body_opened = false;

  for (const auto &unit : forced_units(counter, 0, text.size(), target)) {
    bool at_boundary = depth <= 0 || (method_start_depth && body_opened && depth <= *method_start_depth);
    int tokens = accumulator.tokens_with(unit);

    if (tokens > target && accumulator.has_new_content() && at_boundary) {
      accumulator.close();
    } else if (tokens > 2 * target && accumulator.has_new_content()) {
      // No safe boundary within 2x budget: re-chunk the pending content by lines.
      TextSpan pending = accumulator.take_new_content();
      for (const auto &line : forced_units(counter, pending.begin, pending.end, target)) {
        if (accumulator.tokens_with(line) > target && accumulator.has_new_content()) {
          accumulator.close();
        }
        accumulator.add(line);
      }
      if (accumulator.tokens_with(unit) > target && accumulator.has_new_content()) {
        accumulator.close();
      }
    }
    accumulator.add(unit);

    std::string_view line = text.substr(unit.begin, unit.end - unit.begin);
    if (std::regex_search(line.begin(), line.end(), signature_regex_)) {
      method_start_depth = depth;
      body_opened = false;
    }
    const int opens = static_cast<int>(std::count(line.begin(), line.end(), '{'));
    depth += opens;
    depth -= static_cast<int>(std::count(line.begin(), line.end(), '}'));
    // Allman style puts the opening brace on the line after the signature.
    if (method_start_depth && opens > 0) {
      body_opened = true;
    }
  }
  return accumulator.finish();
}

}  // namespace sift_core
