#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/db/metadata_store.hpp"
#include "sift_core/index/index_store.hpp"
#include "sift_core/llm/embedding_provider.hpp"
#include "sift_core/search/lexical_index.hpp"

namespace sift_core {

class SearchServiceError : public std::exception {
 public:
  explicit SearchServiceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct RetrievalOptions {
  int query_token_ceiling = 7000;
  double vector_weight = 0.5;
  double lexical_weight = 0.5;
};

struct RetrievalResult {
  ChunkRecord record;
  size_t position = 0;
  double score = 0.0;
  // 1 / (1 + squared L2 distance), 0 outside the vector candidates.
  double vector_score = 0.0;
  // Raw BM25 score.
  double lexical_score = 0.0;
  int rank = 0;
};

/**
 * @class SearchService
 * @brief Hybrid retrieval: vector similarity fused with BM25 over one index.
 *
 * score = vector_weight * similarity + lexical_weight * bm25 / max_bm25.
 * Every entry gets a lexical score; only the 2 * top_k nearest vectors get a
 * similarity. Ties go to the lower position. If the query cannot be embedded
 * the ranking is lexical only.
 */
class SearchService {
 public:
  // A null provider always ranks lexically.
  explicit SearchService(std::shared_ptr<EmbeddingProvider> provider, RetrievalOptions options = {});

  SearchService(const SearchService &) = delete;
  SearchService &operator=(const SearchService &) = delete;

  std::vector<RetrievalResult> query(const IndexHandle &handle, const std::string &query_text, int top_k);

 private:
  std::optional<std::vector<float>> embed_query(const std::string &query_text);
  std::shared_ptr<const LexicalIndex> lexical_index_for(const IndexHandle &handle);

  std::shared_ptr<EmbeddingProvider> provider_;
  RetrievalOptions options_;

  std::mutex cache_mutex_;
  uint64_t cached_revision_ = 0;
  std::shared_ptr<const LexicalIndex> cached_lexical_;
};

}  // namespace sift_core
