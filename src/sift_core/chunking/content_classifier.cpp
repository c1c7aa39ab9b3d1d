#include "sift_core/chunking/content_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace sift_core {

namespace {

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

std::string to_string(ContentKind kind) {
  switch (kind) {
    case ContentKind::BraceCode:
      return "brace_code";
    case ContentKind::BlockSql:
      return "block_sql";
    case ContentKind::Paragraphs:
      return "paragraphs";
    case ContentKind::Lines:
      return "lines";
    default:
      return "lines";
  }
}

ContentKind classify_text(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // C#
  if (contains(lower, "public class") || contains(lower, "namespace") ||
      contains(lower, "using system")) {
    return ContentKind::BraceCode;
  }
  // TypeScript / Angular
  if (contains(lower, "export class") || contains(lower, "import {") ||
      contains(lower, "@component")) {
    return ContentKind::BraceCode;
  }
  // JavaScript
  if (contains(lower, "function(") || contains(lower, "const ") || contains(lower, "var ")) {
    return ContentKind::BraceCode;
  }
  if (contains(lower, "create procedure") || (contains(lower, "begin") && contains(lower, "end"))) {
    return ContentKind::BlockSql;
  }
  return ContentKind::Paragraphs;
}

ContentKind classify_content(const Document &document) {
  switch (document.type) {
    case DocumentType::Sql:
      return ContentKind::BlockSql;
    case DocumentType::SpreadsheetSheet:
      // CSV rows are the only structure a sheet has.
      return ContentKind::Lines;
    default:
      return classify_text(document.text);
  }
}

}  // namespace sift_core
