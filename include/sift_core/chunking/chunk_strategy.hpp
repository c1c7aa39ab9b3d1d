#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sift_core/chunking/content_classifier.hpp"
#include "sift_core/chunking/token_estimator.hpp"

namespace sift_core {

class ChunkingError : public std::exception {
 public:
  explicit ChunkingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Half-open byte range of the document text.
struct TextSpan {
  size_t begin = 0;
  size_t end = 0;
};

// One output chunk: [begin, end), of which [begin, content_begin) is overlap
// repeated from the previous chunk.
struct ChunkSpan {
  size_t begin = 0;
  size_t content_begin = 0;
  size_t end = 0;
};

struct ChunkBudget {
  int target_tokens = 500;
  int overlap_tokens = 50;
};

class ChunkStrategy {
 public:
  virtual ~ChunkStrategy() = default;

  virtual ContentKind kind() const = 0;

  // Whether the structure this strategy cuts on is present in the text.
  virtual bool has_markers(std::string_view text) const = 0;

  // Splits the whole counter text. The returned spans tile the text:
  // the first content_begin is 0, each content_begin equals the previous
  // end, and the last end is the text size.
  virtual std::vector<ChunkSpan> split(const SpanTokenCounter &counter,
                                       const ChunkBudget &budget) const = 0;
};

using ChunkStrategyPtr = std::unique_ptr<ChunkStrategy>;

}  // namespace sift_core
