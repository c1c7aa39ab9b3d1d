#include "sift_core/search/lexical_index.hpp"

#include <cmath>

namespace sift_core {

namespace {

bool is_word_byte(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
         c >= 0x80;
}

char lower_ascii(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}  // namespace

std::vector<std::string> LexicalIndex::tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : text) {
    if (is_word_byte(static_cast<unsigned char>(c))) {
      current.push_back(lower_ascii(c));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

LexicalIndex::LexicalIndex(const std::vector<std::string> &documents, Bm25Params params)
    : params_(params) {
  std::unordered_map<std::string, size_t> document_frequency;
  size_t total_length = 0;

  term_freqs_.reserve(documents.size());
  doc_lengths_.reserve(documents.size());
  for (const auto &document : documents) {
    const auto tokens = tokenize(document);
    std::unordered_map<std::string, int> freqs;
    for (const auto &token : tokens) {
      ++freqs[token];
    }
    for (const auto &[term, count] : freqs) {
      ++document_frequency[term];
    }
    total_length += tokens.size();
    doc_lengths_.push_back(tokens.size());
    term_freqs_.push_back(std::move(freqs));
  }

  if (documents.empty()) {
    return;
  }
  average_length_ = static_cast<double>(total_length) / static_cast<double>(documents.size());

  const double n = static_cast<double>(documents.size());
  double idf_sum = 0.0;
  std::vector<std::string> negative;
  for (const auto &[term, df] : document_frequency) {
    const double value = std::log(n - static_cast<double>(df) + 0.5) - std::log(static_cast<double>(df) + 0.5);
    idf_[term] = value;
    idf_sum += value;
    if (value < 0.0) {
      negative.push_back(term);
    }
  }
  const double floor = params_.epsilon * (idf_sum / static_cast<double>(idf_.size()));
  for (const auto &term : negative) {
    idf_[term] = floor;
  }
}

double LexicalIndex::idf(const std::string &term) const {
  auto it = idf_.find(term);
  return it == idf_.end() ? 0.0 : it->second;
}

std::vector<double> LexicalIndex::scores(std::string_view query) const {
  std::vector<double> result(term_freqs_.size(), 0.0);
  if (average_length_ <= 0.0) {
    return result;
  }

  for (const auto &term : tokenize(query)) {
    const double term_idf = idf(term);
    if (term_idf == 0.0) {
      continue;
    }
    for (size_t i = 0; i < term_freqs_.size(); ++i) {
      auto it = term_freqs_[i].find(term);
      if (it == term_freqs_[i].end()) {
        continue;
      }
      const double tf = it->second;
      const double norm =
          params_.k1 * (1.0 - params_.b + params_.b * static_cast<double>(doc_lengths_[i]) / average_length_);
      result[i] += term_idf * (tf * (params_.k1 + 1.0)) / (tf + norm);
    }
  }
  return result;
}

}  // namespace sift_core
