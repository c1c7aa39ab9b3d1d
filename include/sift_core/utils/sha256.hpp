#pragma once

#include <openssl/evp.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace sift_core {

class HashingError : public std::exception {
 public:
  explicit HashingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Incremental SHA-256 over an EVP digest context.
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;

  void update(std::string_view data);
  // Finalizes the digest. The object cannot be updated afterwards.
  std::string hex_digest();

 private:
  EVP_MD_CTX *ctx_;
  bool finalized_ = false;
};

std::string sha256_hex(std::string_view data);
std::string sha256_file_hex(const std::filesystem::path &file_path);

}  // namespace sift_core
