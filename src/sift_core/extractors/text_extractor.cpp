#include "sift_core/extractors/text_extractor.hpp"

namespace sift_core {

bool TextExtractor::can_handle(const fs::path &file_path) const {
  const std::string extension = lower_extension(file_path);
  return extension == ".txt" || extension == ".md";
}

std::vector<Document> TextExtractor::extract(const fs::path &file_path,
                                             const std::string &source_id) const {
  std::string content = read_file(file_path);
  if (content.empty()) {
    return {};
  }
  std::vector<Document> documents;
  documents.push_back(make_document(std::move(content), source_id, DocumentType::GenericText));
  return documents;
}

}  // namespace sift_core
