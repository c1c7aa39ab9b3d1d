#include "sift_core/types/document.hpp"

#include <stdexcept>

#include "sift_core/utils/sha256.hpp"

namespace sift_core {

std::string to_string(DocumentType type) {
  switch (type) {
    case DocumentType::Code:
      return "code";
    case DocumentType::Sql:
      return "sql";
    case DocumentType::SpreadsheetSheet:
      return "spreadsheet_sheet";
    case DocumentType::GenericText:
      return "generic_text";
    case DocumentType::ManualNote:
      return "manual_note";
    default:
      return "generic_text";
  }
}

DocumentType document_type_from_string(const std::string &str) {
  if (str == "code")
    return DocumentType::Code;
  if (str == "sql")
    return DocumentType::Sql;
  if (str == "spreadsheet_sheet")
    return DocumentType::SpreadsheetSheet;
  if (str == "generic_text")
    return DocumentType::GenericText;
  if (str == "manual_note")
    return DocumentType::ManualNote;
  throw std::invalid_argument("Unknown DocumentType: " + str);
}

Document make_document(std::string text,
                       std::string source_id,
                       DocumentType type,
                       DocumentAttributes attributes) {
  Document document;
  document.content_hash = sha256_hex(text);
  document.text = std::move(text);
  document.source_id = std::move(source_id);
  document.type = type;
  document.attributes = std::move(attributes);
  return document;
}

}  // namespace sift_core
