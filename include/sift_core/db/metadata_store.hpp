#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sift_core/types/chunk.hpp"
#include "sift_core/types/document.hpp"

namespace sift_core {

class MetadataStoreError : public std::exception {
 public:
  explicit MetadataStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// What the index keeps about one embedded chunk. Record i belongs to vector i.
struct ChunkRecord {
  std::string source_id;
  DocumentType type = DocumentType::GenericText;
  std::string title;
  int chunk_id = 0;
  int token_estimate = 0;
  size_t start_offset = 0;
  size_t end_offset = 0;
  std::string text;
  // SHA-256 of text.
  std::string content_hash;
  DocumentAttributes attributes;

  static ChunkRecord from_chunk(const Chunk &chunk);
};

struct MetadataFileInfo {
  size_t entry_count = 0;
  size_t dimension = 0;
  std::string index_kind;
  // Digest of the vector file this metadata file was written with.
  std::string vector_file_sha256;
  std::string created_at;
};

/**
 * @class MetadataStore
 * @brief The ordered chunk records of one index, in a single SQLite file.
 *
 * Chunk text and sheet CSV bytes are stored zstd-compressed. The file is
 * always written whole; IndexStore writes it to a temporary path and renames
 * it into place next to its vector file.
 */
class MetadataStore {
 public:
  explicit MetadataStore(const std::filesystem::path &db_path);

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  // Replaces every record and the info row in one transaction.
  void write(const std::vector<ChunkRecord> &records, const MetadataFileInfo &info);

  // Records ordered by position. Throws if positions are not 0..n-1.
  std::vector<ChunkRecord> read_records();

  std::optional<MetadataFileInfo> read_info();

  size_t count();

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);

 private:
  void create_schema();

  std::filesystem::path db_path_;
  sqlite::database db_;
};

}  // namespace sift_core
