#pragma once

#include <string_view>

#include "document_extractor.hpp"

namespace sift_core {

/**
 * @class SheetExtractor
 * @brief Reads a .csv file as one spreadsheet sheet.
 *
 * The document text is the CSV text itself. The first record is taken as the
 * header row; rows counts the records after it.
 */
class SheetExtractor : public DocumentExtractor {
 public:
  bool can_handle(const fs::path &file_path) const override;

  std::vector<Document> extract(const fs::path &file_path, const std::string &source_id) const override;

  // RFC 4180 records: quoted fields may hold commas, newlines and "" escapes.
  static std::vector<std::vector<std::string>> parse_csv(std::string_view csv);
};

}  // namespace sift_core
