#include "sift_core/extractors/document_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace sift_core {

std::string DocumentExtractor::read_file(const fs::path &file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentExtractorError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string DocumentExtractor::lower_extension(const fs::path &file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

}  // namespace sift_core
