#include "sift_core/llm/embedding_provider.hpp"

namespace sift_core {

std::string to_string(EmbeddingError::Kind kind) {
  switch (kind) {
    case EmbeddingError::Kind::RateLimited:
      return "rate_limited";
    case EmbeddingError::Kind::Transient:
      return "transient";
    case EmbeddingError::Kind::Fatal:
      return "fatal";
    default:
      return "fatal";
  }
}

}  // namespace sift_core
