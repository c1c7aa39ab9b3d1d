#pragma once

#include <string>
#include <vector>

namespace sift_core {

class EmbeddingError : public std::exception {
 public:
  enum class Kind { RateLimited, Transient, Fatal };

  EmbeddingError(Kind kind, const std::string &message) : kind_(kind), message_(message) {}

  Kind kind() const noexcept {
    return kind_;
  }

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  Kind kind_;
  std::string message_;
};

std::string to_string(EmbeddingError::Kind kind);

// Synchronous embedding backend. Returns one vector per input text, in order.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) = 0;
};

}  // namespace sift_core
