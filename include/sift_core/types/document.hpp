#pragma once

#include <string>
#include <vector>

namespace sift_core {

enum class DocumentType { Code, Sql, SpreadsheetSheet, GenericText, ManualNote };

std::string to_string(DocumentType type);
DocumentType document_type_from_string(const std::string &str);

// Spreadsheet fields; left empty for every other document type.
struct DocumentAttributes {
  std::string sheet_name;
  int sheet_rows = 0;
  int sheet_cols = 0;
  std::vector<std::string> headers;
  std::string sheet_csv_bytes;
};

struct Document {
  std::string text;
  std::string source_id;
  DocumentType type = DocumentType::GenericText;
  std::string content_hash;
  DocumentAttributes attributes;
};

// Builds a document and fills in its content hash.
Document make_document(std::string text,
                       std::string source_id,
                       DocumentType type,
                       DocumentAttributes attributes = {});

}  // namespace sift_core
