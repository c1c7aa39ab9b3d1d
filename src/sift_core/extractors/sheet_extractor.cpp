#include "sift_core/extractors/sheet_extractor.hpp"

#include <algorithm>

namespace sift_core {

bool SheetExtractor::can_handle(const fs::path &file_path) const {
  return lower_extension(file_path) == ".csv";
}

std::vector<std::vector<std::string>> SheetExtractor::parse_csv(std::string_view csv) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  bool record_started = false;

  auto end_field = [&]() {
    record.push_back(std::move(field));
    field.clear();
  };
  auto end_record = [&]() {
    end_field();
    records.push_back(std::move(record));
    record.clear();
    record_started = false;
  };

  for (size_t i = 0; i < csv.size(); ++i) {
    const char c = csv[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < csv.size() && csv[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    switch (c) {
      case '"':
        in_quotes = true;
        record_started = true;
        break;
      case ',':
        end_field();
        record_started = true;
        break;
      case '\r':
        break;
      case '\n':
        if (record_started || !field.empty() || !record.empty()) {
          end_record();
        }
        break;
      default:
        field.push_back(c);
        record_started = true;
        break;
    }
  }
  if (record_started || !field.empty() || !record.empty()) {
    end_record();
  }
  return records;
}

std::vector<Document> SheetExtractor::extract(const fs::path &file_path,
                                              const std::string &source_id) const {
  std::string csv = read_file(file_path);
  const auto records = parse_csv(csv);
  if (records.empty()) {
    return {};
  }

  DocumentAttributes attributes;
  attributes.sheet_name = file_path.stem().string();
  attributes.headers = records.front();
  attributes.sheet_rows = static_cast<int>(records.size() - 1);
  size_t widest = 0;
  for (const auto &record : records) {
    widest = std::max(widest, record.size());
  }
  attributes.sheet_cols = static_cast<int>(widest);
  attributes.sheet_csv_bytes = csv;

  std::vector<Document> documents;
  documents.push_back(
      make_document(std::move(csv), source_id, DocumentType::SpreadsheetSheet, std::move(attributes)));
  return documents;
}

}  // namespace sift_core
