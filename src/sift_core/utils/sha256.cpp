#include "sift_core/utils/sha256.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace sift_core {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw HashingError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw HashingError("Failed to initialize SHA256 digest");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(ctx_);
}

void Sha256::update(std::string_view data) {
  if (finalized_) {
    throw HashingError("SHA256 digest already finalized");
  }
  if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
    throw HashingError("Failed to update SHA256 digest");
  }
}

std::string Sha256::hex_digest() {
  if (finalized_) {
    throw HashingError("SHA256 digest already finalized");
  }
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
    throw HashingError("Failed to finalize SHA256 digest");
  }
  finalized_ = true;

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string sha256_hex(std::string_view data) {
  Sha256 digest;
  digest.update(data);
  return digest.hex_digest();
}

std::string sha256_file_hex(const std::filesystem::path &file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw HashingError("Could not open file for hashing: " + file_path.string());
  }

  Sha256 digest;
  std::vector<char> buffer(1 << 16);
  while (file_stream) {
    file_stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = file_stream.gcount();
    if (read > 0) {
      digest.update(std::string_view(buffer.data(), static_cast<size_t>(read)));
    }
  }
  if (file_stream.bad()) {
    throw HashingError("Failed while reading file for hashing: " + file_path.string());
  }
  return digest.hex_digest();
}

}  // namespace sift_core
