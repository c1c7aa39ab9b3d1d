#include "sift_core/chunking/structural_chunker.hpp"

#include <iostream>

#include "sift_core/chunking/block_sql_strategy.hpp"
#include "sift_core/chunking/brace_code_strategy.hpp"
#include "sift_core/chunking/paragraph_strategy.hpp"

namespace sift_core {

namespace {

std::string chunk_title(const Document &document, size_t part, size_t parts) {
  std::string title = document.source_id;
  if (!document.attributes.sheet_name.empty()) {
    title += " - " + document.attributes.sheet_name;
  }
  return title + " (Part " + std::to_string(part) + "/" + std::to_string(parts) + ")";
}

void check_tiling(const std::vector<ChunkSpan> &spans,
                  const SpanTokenCounter &counter,
                  int target_tokens,
                  const std::string &source_id) {
  size_t expected = 0;
  for (const auto &span : spans) {
    if (span.content_begin != expected || span.begin > span.content_begin ||
        span.end <= span.content_begin) {
      throw ChunkingError("Chunk spans for " + source_id + " do not tile the document at byte " +
                          std::to_string(expected));
    }
    if (counter.estimate(span.begin, span.end) > 2 * target_tokens) {
      throw ChunkingError("Chunk of " + source_id + " at byte " + std::to_string(span.begin) +
                          " exceeds twice the target of " + std::to_string(target_tokens) +
                          " tokens");
    }
    expected = span.end;
  }
  if (expected != counter.size()) {
    throw ChunkingError("Chunk spans for " + source_id + " stop at byte " +
                        std::to_string(expected) + " of " + std::to_string(counter.size()));
  }
}

}  // namespace

StructuralChunker::StructuralChunker() {
  // Indexed by ContentKind.
  strategies_.push_back(std::make_unique<BraceCodeStrategy>());
  strategies_.push_back(std::make_unique<BlockSqlStrategy>());
  strategies_.push_back(std::make_unique<ParagraphStrategy>());
  strategies_.push_back(std::make_unique<LineStrategy>());
}

ContentKind StructuralChunker::resolve_kind(const Document &document) const {
  ContentKind classified = classify_content(document);
  for (size_t i = static_cast<size_t>(classified); i < strategies_.size(); ++i) {
    if (strategies_[i]->has_markers(document.text)) {
      return strategies_[i]->kind();
    }
  }
  return ContentKind::Lines;
}

std::vector<Chunk> StructuralChunker::chunk(const Document &document,
                                            int target_tokens,
                                            int overlap_tokens) const {
  if (target_tokens <= 0) {
    throw ChunkingError("target_tokens must be positive, got " + std::to_string(target_tokens));
  }
  if (overlap_tokens < 0) {
    throw ChunkingError("overlap_tokens cannot be negative, got " +
                        std::to_string(overlap_tokens));
  }
  if (document.text.empty()) {
    return {};
  }

  SpanTokenCounter counter(document.text);
  const ChunkBudget budget{.target_tokens = target_tokens, .overlap_tokens = overlap_tokens};

  std::vector<ChunkSpan> spans;
  if (counter.estimate(0, counter.size()) <= target_tokens) {
    spans.push_back({0, 0, counter.size()});
  } else {
    ContentKind classified = classify_content(document);
    ContentKind kind = resolve_kind(document);
    if (kind != classified) {
      std::cout << "[Chunker] " << document.source_id << ": no " << to_string(classified)
                << " structure, using " << to_string(kind) << std::endl;
    }
    spans = strategies_[static_cast<size_t>(kind)]->split(counter, budget);
  }
  check_tiling(spans, counter, target_tokens, document.source_id);

  std::vector<Chunk> chunks;
  chunks.reserve(spans.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    const ChunkSpan &span = spans[i];
    Chunk chunk;
    chunk.content = document.text.substr(span.begin, span.end - span.begin);
    chunk.source_id = document.source_id;
    chunk.type = document.type;
    chunk.chunk_id = static_cast<int>(i);
    chunk.token_estimate = counter.estimate(span.begin, span.end);
    chunk.start_offset = span.begin;
    chunk.end_offset = span.end;
    chunk.overlap_bytes = span.content_begin - span.begin;
    chunk.title = chunk_title(document, i + 1, spans.size());
    chunk.attributes = document.attributes;
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

}  // namespace sift_core
