#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "sift_core/db/metadata_store.hpp"
#include "sift_core/index/vector_index.hpp"

namespace sift_core {

// Vector count and metadata count (or dimensions) disagree.
class IndexMismatchError : public std::exception {
 public:
  explicit IndexMismatchError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class PersistenceError : public std::exception {
 public:
  explicit PersistenceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class IndexStoreError : public std::exception {
 public:
  explicit IndexStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A vector index and its records, always changed together.
struct IndexHandle {
  VectorIndex vectors;
  std::vector<ChunkRecord> records;
  // Changes whenever the entries change; caches key on it.
  uint64_t revision = 0;

  size_t size() const {
    return records.size();
  }
};

struct VerifyReport {
  bool consistent = true;
  size_t vector_count = 0;
  size_t metadata_count = 0;
  size_t dimension = 0;
  std::vector<std::string> problems;
};

/**
 * @class IndexStore
 * @brief Builds, extends, saves and reopens IndexHandles.
 *
 * On disk an index is two files: <name>.faiss holding the vectors and
 * <name>.meta.db holding the records plus the SHA-256 of the .faiss file it
 * was written with. Both are written to temporaries and renamed into place,
 * vectors first, so an interrupted save leaves a pair that load() rejects
 * rather than one that silently mismatches.
 */
class IndexStore {
 public:
  explicit IndexStore(IndexKind kind = IndexKind::Flat) : kind_(kind) {}

  // vectors[i] belongs to records[i]. Throws IndexMismatchError on a count mismatch.
  IndexHandle build(const std::vector<std::vector<float>> &vectors,
                    std::vector<ChunkRecord> records) const;

  // Validates everything before touching the handle; the handle is unchanged on throw.
  void append(IndexHandle &handle,
              const std::vector<std::vector<float>> &vectors,
              std::vector<ChunkRecord> records) const;

  void persist(const IndexHandle &handle, const std::filesystem::path &vector_path) const;

  IndexHandle load(const std::filesystem::path &vector_path) const;

  VerifyReport verify_report(const IndexHandle &handle) const;

  // False (with diagnostics on stderr) when the handle is inconsistent. Never repairs.
  bool verify(const IndexHandle &handle) const;

  static std::filesystem::path metadata_path_for(const std::filesystem::path &vector_path);

  IndexKind kind() const {
    return kind_;
  }

 private:
  IndexKind kind_;
};

}  // namespace sift_core
