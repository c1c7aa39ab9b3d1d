#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "document_extractor.hpp"

/**
 * @class DocumentExtractorFactory
 * @brief Picks the DocumentExtractor for a file and reads whole input folders.
 *
 * Extractors are asked in registration order; the first one that can handle
 * the file wins. This class is non-copyable and non-movable.
 */
namespace sift_core {
class DocumentExtractorFactory {
 public:
  DocumentExtractorFactory();

  // nullptr when no extractor handles the file.
  const DocumentExtractor *find_extractor_for(const std::filesystem::path &file_path) const;

  /**
   * @throw DocumentExtractorError if no suitable extractor is found.
   */
  const DocumentExtractor &get_extractor_for(const std::filesystem::path &file_path) const;

  /**
   * @brief Reads every supported file under root, recursively, in path order.
   *
   * Source ids are paths relative to root. Unsupported files are skipped and
   * reported on stdout.
   * @throw DocumentExtractorError if root is not a directory or a file cannot be read.
   */
  std::vector<Document> read_directory(const std::filesystem::path &root) const;

  DocumentExtractorFactory(const DocumentExtractorFactory &) = delete;
  DocumentExtractorFactory &operator=(const DocumentExtractorFactory &) = delete;
  DocumentExtractorFactory(DocumentExtractorFactory &&) = delete;
  DocumentExtractorFactory &operator=(DocumentExtractorFactory &&) = delete;

 private:
  std::vector<DocumentExtractorPtr> extractors_;
};

// Free text typed in by an operator.
Document make_manual_note(std::string text);

}  // namespace sift_core
