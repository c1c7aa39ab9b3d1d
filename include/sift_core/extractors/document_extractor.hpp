#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sift_core/types/document.hpp"

namespace fs = std::filesystem;

namespace sift_core {

class DocumentExtractorError : public std::exception {
 public:
  explicit DocumentExtractorError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DocumentExtractor {
 public:
  virtual ~DocumentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path &file_path) const = 0;

  // Reads the file into documents named source_id. An empty file yields none.
  virtual std::vector<Document> extract(const fs::path &file_path, const std::string &source_id) const = 0;

 protected:
  std::string read_file(const fs::path &file_path) const;
  static std::string lower_extension(const fs::path &file_path);
};

using DocumentExtractorPtr = std::unique_ptr<DocumentExtractor>;

}  // namespace sift_core
