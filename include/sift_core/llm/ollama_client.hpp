#pragma once

#include <string>
#include <vector>

#include "sift_core/llm/embedding_provider.hpp"

namespace sift_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaClient : public EmbeddingProvider {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Get embedding for text
  virtual std::vector<float> get_embedding(const std::string &text);

  // One request per text; failures are mapped onto EmbeddingError kinds.
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) override;

  // Maps an ollama-hpp failure message onto a retry class.
  static EmbeddingError::Kind classify_failure(const std::string &message);

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
};

}  // namespace sift_core
