#pragma once

#include <cstddef>
#include <string>

#include "sift_core/types/document.hpp"

namespace sift_core {

struct Chunk {
  std::string content;
  std::string source_id;
  DocumentType type = DocumentType::GenericText;
  int chunk_id = 0;
  int token_estimate = 0;
  // Byte range of content within the document text.
  size_t start_offset = 0;
  size_t end_offset = 0;
  // Leading bytes of content repeated from the previous chunk.
  size_t overlap_bytes = 0;
  std::string title;
  DocumentAttributes attributes;
};

}  // namespace sift_core
