#pragma once

#include "document_extractor.hpp"

namespace sift_core {

// Source files. .sql becomes an sql document, everything else code.
class CodeExtractor : public DocumentExtractor {
 public:
  bool can_handle(const fs::path &file_path) const override;

  std::vector<Document> extract(const fs::path &file_path, const std::string &source_id) const override;
};

}  // namespace sift_core
