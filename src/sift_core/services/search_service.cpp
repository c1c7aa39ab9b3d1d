#include "sift_core/services/search_service.hpp"

#include <algorithm>
#include <iostream>

#include "sift_core/chunking/token_estimator.hpp"

namespace sift_core {

SearchService::SearchService(std::shared_ptr<EmbeddingProvider> provider, RetrievalOptions options)
    : provider_(std::move(provider)), options_(options) {
  if (options_.vector_weight < 0.0 || options_.lexical_weight < 0.0) {
    throw SearchServiceError("Fusion weights must not be negative");
  }
}

std::optional<std::vector<float>> SearchService::embed_query(const std::string &query_text) {
  if (!provider_) {
    return std::nullopt;
  }
  try {
    auto vectors = provider_->embed_batch({query_text});
    if (vectors.size() != 1 || vectors.front().empty()) {
      std::cerr << "[Search] Provider returned " << vectors.size()
                << " vectors for the query; ranking lexically." << std::endl;
      return std::nullopt;
    }
    return std::move(vectors.front());
  } catch (const EmbeddingError &e) {
    std::cerr << "[Search] Query embedding failed (" << to_string(e.kind())
              << "), ranking lexically: " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::shared_ptr<const LexicalIndex> SearchService::lexical_index_for(const IndexHandle &handle) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  if (cached_lexical_ && cached_revision_ == handle.revision) {
    return cached_lexical_;
  }
  std::vector<std::string> texts;
  texts.reserve(handle.records.size());
  for (const auto &record : handle.records) {
    texts.push_back(record.text);
  }
  cached_lexical_ = std::make_shared<const LexicalIndex>(texts);
  cached_revision_ = handle.revision;
  return cached_lexical_;
}

std::vector<RetrievalResult> SearchService::query(const IndexHandle &handle,
                                                  const std::string &query_text,
                                                  int top_k) {
  if (top_k <= 0) {
    throw SearchServiceError("top_k must be positive, got " + std::to_string(top_k));
  }
  const size_t n = handle.records.size();
  if (n == 0) {
    return {};
  }

  std::string text = query_text;
  const int query_tokens = estimate_tokens(text);
  if (query_tokens > options_.query_token_ceiling) {
    std::cerr << "[Search] Query has " << query_tokens << " tokens, truncating to "
              << options_.query_token_ceiling << std::endl;
    text = truncate_to_token_budget(text, options_.query_token_ceiling);
  }

  std::vector<double> similarity(n, 0.0);
  if (auto query_vector = embed_query(text)) {
    try {
      for (const auto &neighbor : handle.vectors.search(*query_vector, 2 * static_cast<size_t>(top_k))) {
        if (neighbor.position < n) {
          similarity[neighbor.position] = 1.0 / (1.0 + static_cast<double>(neighbor.distance));
        }
      }
    } catch (const VectorIndexError &e) {
      std::cerr << "[Search] Vector search failed, ranking lexically: " << e.what() << std::endl;
      std::fill(similarity.begin(), similarity.end(), 0.0);
    }
  }

  const auto lexical = lexical_index_for(handle);
  const std::vector<double> bm25 = lexical->scores(text);
  double max_bm25 = 0.0;
  for (double s : bm25) {
    max_bm25 = std::max(max_bm25, s);
  }

  std::vector<RetrievalResult> scored;
  scored.reserve(n);
  for (size_t position = 0; position < n; ++position) {
    const double normalized = max_bm25 > 0.0 ? std::max(bm25[position], 0.0) / max_bm25 : 0.0;
    scored.push_back(RetrievalResult{.record = {},
                                     .position = position,
                                     .score = options_.vector_weight * similarity[position] +
                                              options_.lexical_weight * normalized,
                                     .vector_score = similarity[position],
                                     .lexical_score = bm25[position],
                                     .rank = 0});
  }

  const size_t keep = std::min(n, static_cast<size_t>(top_k));
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep), scored.end(),
                    [](const RetrievalResult &a, const RetrievalResult &b) {
                      if (a.score != b.score) {
                        return a.score > b.score;
                      }
                      return a.position < b.position;
                    });
  scored.resize(keep);
  for (size_t i = 0; i < scored.size(); ++i) {
    scored[i].record = handle.records[scored[i].position];
    scored[i].rank = static_cast<int>(i + 1);
  }
  return scored;
}

}  // namespace sift_core
