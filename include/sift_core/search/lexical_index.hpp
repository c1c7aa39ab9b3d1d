#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sift_core {

struct Bm25Params {
  double k1 = 1.5;
  double b = 0.75;
  // Negative idf values are replaced by epsilon * mean idf.
  double epsilon = 0.25;
};

/**
 * @class LexicalIndex
 * @brief BM25 Okapi over a fixed corpus.
 *
 * Terms are lower-cased runs of word characters (ASCII letters, digits,
 * underscore, and any non-ASCII byte so UTF-8 words stay whole).
 */
class LexicalIndex {
 public:
  explicit LexicalIndex(const std::vector<std::string> &documents, Bm25Params params = {});

  // One score per document, in corpus order.
  std::vector<double> scores(std::string_view query) const;

  double idf(const std::string &term) const;

  size_t size() const {
    return term_freqs_.size();
  }

  static std::vector<std::string> tokenize(std::string_view text);

 private:
  Bm25Params params_;
  std::vector<std::unordered_map<std::string, int>> term_freqs_;
  std::vector<size_t> doc_lengths_;
  std::unordered_map<std::string, double> idf_;
  double average_length_ = 0.0;
};

}  // namespace sift_core
