#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace sift_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

// zstd framing for the text and CSV columns of the metadata file.
class CompressionService {
 public:
  /**
   * @brief Compresses a block of text with Zstandard.
   * @param data The bytes to compress. Empty input yields an empty blob.
   * @param compression_level zstd level, 3 unless overridden.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Restores text written by compress().
   * @throws CompressionError when the blob is not a zstd frame with a known
   *         content size, or when the frame claims more than max_output bytes.
   */
  static std::string decompress(const std::vector<char> &compressed_data,
                                std::size_t max_output = kMaxDecompressedBytes);

  static constexpr std::size_t kMaxDecompressedBytes = 256u * 1024u * 1024u;
};

}  // namespace sift_core
