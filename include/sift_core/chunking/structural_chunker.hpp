#pragma once

#include <vector>

#include "sift_core/chunking/chunk_strategy.hpp"
#include "sift_core/chunking/content_classifier.hpp"
#include "sift_core/types/chunk.hpp"
#include "sift_core/types/document.hpp"

/**
 * @class StructuralChunker
 * @brief Splits a document into token-budgeted chunks along its own structure.
 *
 * The document is classified into a ContentKind and handed to that kind's
 * strategy. A strategy whose markers are absent degrades to the next kind in
 * the chain BraceCode -> BlockSql -> Paragraphs -> Lines.
 *
 * Every chunk is within 2 x target_tokens, and concatenating each chunk's
 * content after its overlap prefix reproduces the document text exactly.
 */
namespace sift_core {
class StructuralChunker {
 public:
  StructuralChunker();

  std::vector<Chunk> chunk(const Document &document, int target_tokens, int overlap_tokens) const;

  // The kind whose strategy will actually run for this document.
  ContentKind resolve_kind(const Document &document) const;

  StructuralChunker(const StructuralChunker &) = delete;
  StructuralChunker &operator=(const StructuralChunker &) = delete;

 private:
  std::vector<ChunkStrategyPtr> strategies_;
};
}  // namespace sift_core
