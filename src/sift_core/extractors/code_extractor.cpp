#include "sift_core/extractors/code_extractor.hpp"

#include <array>
#include <string_view>

namespace sift_core {

namespace {
constexpr std::array<std::string_view, 8> CODE_EXTENSIONS = {
    ".cs", ".ts", ".tsx", ".js", ".sql", ".cshtml", ".html", ".config"};
}

bool CodeExtractor::can_handle(const fs::path &file_path) const {
  const std::string extension = lower_extension(file_path);
  for (auto known : CODE_EXTENSIONS) {
    if (extension == known) {
      return true;
    }
  }
  return false;
}

std::vector<Document> CodeExtractor::extract(const fs::path &file_path,
                                             const std::string &source_id) const {
  std::string content = read_file(file_path);
  if (content.empty()) {
    return {};
  }
  const DocumentType type = lower_extension(file_path) == ".sql" ? DocumentType::Sql : DocumentType::Code;
  std::vector<Document> documents;
  documents.push_back(make_document(std::move(content), source_id, type));
  return documents;
}

}  // namespace sift_core
