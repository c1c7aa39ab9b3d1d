#pragma once

#include <gmock/gmock.h>

#include <cmath>
#include <functional>
#include <string>
#include <vector>

#include "sift_core/llm/embedding_provider.hpp"
#include "sift_core/search/lexical_index.hpp"

namespace sift_tests {

/**
 * Mock class for EmbeddingProvider to use in tests
 */
class MockEmbeddingProvider : public sift_core::EmbeddingProvider {
 public:
  MOCK_METHOD(std::vector<std::vector<float>>, embed_batch, (const std::vector<std::string>& texts), (override));
};

/**
 * Deterministic bag-of-words embedder. Texts sharing words get nearby vectors,
 * which is enough for ranking tests without an Ollama server.
 */
class FakeEmbeddingProvider : public sift_core::EmbeddingProvider {
 public:
  explicit FakeEmbeddingProvider(size_t dimension = 64) : dimension_(dimension) {}

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
    ++calls_;
    if (fail_after_calls_ >= 0 && calls_ > fail_after_calls_) {
      throw sift_core::EmbeddingError(fail_kind_, "fake provider failure on call " + std::to_string(calls_));
    }
    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());
    for (const auto& text : texts) {
      vectors.push_back(embed_one(text));
      ++texts_embedded_;
    }
    return vectors;
  }

  std::vector<float> embed_one(const std::string& text) const {
    std::vector<float> v(dimension_, 0.0f);
    for (const auto& term : sift_core::LexicalIndex::tokenize(text)) {
      v[std::hash<std::string>{}(term) % dimension_] += 1.0f;
    }
    float norm = 0.0f;
    for (float x : v) {
      norm += x * x;
    }
    if (norm == 0.0f) {
      v[0] = 1.0f;
      return v;
    }
    norm = std::sqrt(norm);
    for (float& x : v) {
      x /= norm;
    }
    return v;
  }

  // Every call after the first `calls` succeed throws an EmbeddingError of `kind`.
  void fail_after(int calls, sift_core::EmbeddingError::Kind kind = sift_core::EmbeddingError::Kind::Fatal) {
    fail_after_calls_ = calls_ + calls;
    fail_kind_ = kind;
  }

  void stop_failing() {
    fail_after_calls_ = -1;
  }

  int calls() const {
    return calls_;
  }
  int texts_embedded() const {
    return texts_embedded_;
  }
  size_t dimension() const {
    return dimension_;
  }

 private:
  size_t dimension_;
  int calls_ = 0;
  int texts_embedded_ = 0;
  int fail_after_calls_ = -1;
  sift_core::EmbeddingError::Kind fail_kind_ = sift_core::EmbeddingError::Kind::Fatal;
};

}  // namespace sift_tests
