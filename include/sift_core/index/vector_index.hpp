#pragma once

#include <faiss/Index.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace sift_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class IndexKind { Flat, Hnsw };

std::string to_string(IndexKind kind);
IndexKind index_kind_from_string(const std::string &str);

struct Neighbor {
  size_t position = 0;
  // Squared L2 distance as reported by faiss.
  float distance = 0.0f;
};

/**
 * @class VectorIndex
 * @brief Owning wrapper over a faiss index whose ids are insertion positions.
 *
 * Vectors are added without explicit ids, so the n-th vector ever added is
 * returned as position n. That position is also the row of its record in the
 * metadata store.
 */
class VectorIndex {
 public:
  static constexpr int HNSW_M_PARAM = 32;
  static constexpr int HNSW_EF_CONSTRUCTION_PARAM = 100;
  static constexpr int HNSW_EF_SEARCH_PARAM = 64;

  VectorIndex(size_t dimension, IndexKind kind);

  VectorIndex(VectorIndex &&) noexcept = default;
  VectorIndex &operator=(VectorIndex &&) noexcept = default;
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // All vectors must have dimension() entries.
  void add(const std::vector<std::vector<float>> &vectors);

  // Up to k nearest positions, closest first.
  std::vector<Neighbor> search(const std::vector<float> &query, size_t k) const;

  void write(const std::filesystem::path &path) const;
  static VectorIndex read(const std::filesystem::path &path);

  size_t size() const;
  size_t dimension() const {
    return dimension_;
  }
  IndexKind kind() const {
    return kind_;
  }

 private:
  VectorIndex(std::unique_ptr<faiss::Index> index, IndexKind kind);

  std::unique_ptr<faiss::Index> index_;
  size_t dimension_;
  IndexKind kind_;
};

}  // namespace sift_core
