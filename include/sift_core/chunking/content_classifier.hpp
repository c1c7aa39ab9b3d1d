#pragma once

#include <string>
#include <string_view>

#include "sift_core/types/document.hpp"

namespace sift_core {

// Order matters: the chunker degrades from a kind to the ones after it.
enum class ContentKind { BraceCode, BlockSql, Paragraphs, Lines };

std::string to_string(ContentKind kind);

// Keyword sniff over lower-cased text.
ContentKind classify_text(std::string_view text);

// Type tag first, then classify_text().
ContentKind classify_content(const Document &document);

}  // namespace sift_core
