#include "sift_core/services/compression_service.hpp"

#include <zstd.h>

namespace sift_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> buffer(ZSTD_compressBound(data.size()));
  const size_t written =
      ZSTD_compress(buffer.data(), buffer.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  buffer.resize(written);
  return buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data,
                                           std::size_t max_output) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long expected =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("blob is not a zstd frame with a known content size");
  }
  if (expected > max_output) {
    throw CompressionError("zstd frame claims " + std::to_string(expected) +
                           " bytes, above the limit of " + std::to_string(max_output));
  }

  std::string out(static_cast<size_t>(expected), '\0');
  const size_t produced =
      ZSTD_decompress(out.data(), out.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(produced)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(produced)));
  }
  if (produced != expected) {
    throw CompressionError("zstd frame decoded to " + std::to_string(produced) + " bytes, expected " +
                           std::to_string(expected));
  }
  return out;
}

}  // namespace sift_core
