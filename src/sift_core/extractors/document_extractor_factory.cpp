#include "sift_core/extractors/document_extractor_factory.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

#include "sift_core/extractors/code_extractor.hpp"
#include "sift_core/extractors/sheet_extractor.hpp"
#include "sift_core/extractors/text_extractor.hpp"

namespace sift_core {

DocumentExtractorFactory::DocumentExtractorFactory() {
  extractors_.push_back(std::make_unique<CodeExtractor>());
  extractors_.push_back(std::make_unique<TextExtractor>());
  extractors_.push_back(std::make_unique<SheetExtractor>());
}

const DocumentExtractor *DocumentExtractorFactory::find_extractor_for(
    const std::filesystem::path &file_path) const {
  for (const auto &extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return extractor.get();
    }
  }
  return nullptr;
}

const DocumentExtractor &DocumentExtractorFactory::get_extractor_for(
    const std::filesystem::path &file_path) const {
  if (const auto *extractor = find_extractor_for(file_path)) {
    return *extractor;
  }
  throw DocumentExtractorError("No suitable document extractor found for " + file_path.string());
}

std::vector<Document> DocumentExtractorFactory::read_directory(const std::filesystem::path &root) const {
  if (!std::filesystem::is_directory(root)) {
    throw DocumentExtractorError("Input is not a directory: " + root.string());
  }

  std::vector<std::filesystem::path> files;
  try {
    for (const auto &entry : std::filesystem::recursive_directory_iterator(root)) {
      if (entry.is_regular_file()) {
        files.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw DocumentExtractorError("Failed to scan " + root.string() + ": " + e.what());
  }
  std::sort(files.begin(), files.end());

  std::vector<Document> documents;
  size_t skipped = 0;
  for (const auto &file : files) {
    const auto *extractor = find_extractor_for(file);
    if (!extractor) {
      ++skipped;
      continue;
    }
    const std::string source_id = std::filesystem::relative(file, root).generic_string();
    auto extracted = extractor->extract(file, source_id);
    std::move(extracted.begin(), extracted.end(), std::back_inserter(documents));
  }
  std::cout << "[Reader] Read " << documents.size() << " documents from " << root;
  if (skipped > 0) {
    std::cout << " (" << skipped << " unsupported files skipped)";
  }
  std::cout << std::endl;
  return documents;
}

Document make_manual_note(std::string text) {
  return make_document(std::move(text), "Manual Note", DocumentType::ManualNote);
}

}  // namespace sift_core
