#include "sift_core/db/metadata_store.hpp"

#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "sift_core/db/sqlite_error_utils.hpp"
#include "sift_core/db/transaction.hpp"
#include "sift_core/services/compression_service.hpp"
#include "sift_core/utils/sha256.hpp"

namespace sift_core {

ChunkRecord ChunkRecord::from_chunk(const Chunk &chunk) {
  return ChunkRecord{.source_id = chunk.source_id,
                     .type = chunk.type,
                     .title = chunk.title,
                     .chunk_id = chunk.chunk_id,
                     .token_estimate = chunk.token_estimate,
                     .start_offset = chunk.start_offset,
                     .end_offset = chunk.end_offset,
                     .text = chunk.content,
                     .content_hash = sha256_hex(chunk.content),
                     .attributes = chunk.attributes};
}

std::string MetadataStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

namespace {

sqlite::database open_metadata_file(const std::filesystem::path &db_path) {
  try {
    return open_database_file(db_path.string(), true);
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("metadata open", db_path, e));
  }
}

}  // namespace

MetadataStore::MetadataStore(const std::filesystem::path &db_path)
    : db_path_(db_path), db_(open_metadata_file(db_path)) {
  try {
    create_schema();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("metadata schema setup", db_path_, e));
  }
}

void MetadataStore::create_schema() {
  db_ << R"(
    CREATE TABLE IF NOT EXISTS chunks (
      position INTEGER PRIMARY KEY,
      source_id TEXT NOT NULL,
      doc_type TEXT NOT NULL,
      title TEXT NOT NULL,
      chunk_id INTEGER NOT NULL,
      token_estimate INTEGER NOT NULL,
      start_offset INTEGER NOT NULL,
      end_offset INTEGER NOT NULL,
      content_hash TEXT NOT NULL,
      content BLOB,
      sheet_name TEXT,
      sheet_rows INTEGER,
      sheet_cols INTEGER,
      headers TEXT,
      sheet_csv BLOB
    );
  )";
  db_ << R"(
    CREATE TABLE IF NOT EXISTS index_info (
      id INTEGER PRIMARY KEY CHECK (id = 1),
      entry_count INTEGER NOT NULL,
      dimension INTEGER NOT NULL,
      index_kind TEXT NOT NULL,
      vector_sha256 TEXT NOT NULL,
      created_at TEXT NOT NULL
    );
  )";
}

void MetadataStore::write(const std::vector<ChunkRecord> &records, const MetadataFileInfo &info) {
  try {
    Transaction tx(db_);
    db_ << "DELETE FROM chunks;";
    db_ << "DELETE FROM index_info;";

    for (size_t position = 0; position < records.size(); ++position) {
      const ChunkRecord &r = records[position];
      const nlohmann::json headers = r.attributes.headers;
      db_ << "INSERT INTO chunks (position, source_id, doc_type, title, chunk_id, token_estimate, "
             "start_offset, end_offset, content_hash, content, sheet_name, sheet_rows, sheet_cols, "
             "headers, sheet_csv) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);"
          << static_cast<int64_t>(position) << r.source_id << to_string(r.type) << r.title
          << r.chunk_id << r.token_estimate << static_cast<int64_t>(r.start_offset)
          << static_cast<int64_t>(r.end_offset) << r.content_hash
          << CompressionService::compress(r.text) << r.attributes.sheet_name
          << r.attributes.sheet_rows << r.attributes.sheet_cols << headers.dump()
          << CompressionService::compress(r.attributes.sheet_csv_bytes);
    }

    db_ << "INSERT INTO index_info (id, entry_count, dimension, index_kind, vector_sha256, "
           "created_at) VALUES (1, ?, ?, ?, ?, ?);"
        << static_cast<int64_t>(info.entry_count) << static_cast<int64_t>(info.dimension)
        << info.index_kind << info.vector_file_sha256 << info.created_at;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("metadata write", db_path_, e));
  }
}

std::vector<ChunkRecord> MetadataStore::read_records() {
  std::vector<ChunkRecord> records;
  try {
    db_ << "SELECT position, source_id, doc_type, title, chunk_id, token_estimate, start_offset, "
           "end_offset, content_hash, content, sheet_name, sheet_rows, sheet_cols, headers, "
           "sheet_csv FROM chunks ORDER BY position;" >>
        [&](int64_t position, std::string source_id, std::string doc_type, std::string title,
            int chunk_id, int token_estimate, int64_t start_offset, int64_t end_offset,
            std::string content_hash, std::optional<std::vector<char>> content,
            std::optional<std::string> sheet_name, std::optional<int> sheet_rows,
            std::optional<int> sheet_cols, std::optional<std::string> headers,
            std::optional<std::vector<char>> sheet_csv) {
          if (position != static_cast<int64_t>(records.size())) {
            throw MetadataStoreError("Metadata file " + db_path_.string() + " has no record at position " +
                                     std::to_string(records.size()));
          }
          ChunkRecord record{.source_id = std::move(source_id),
                             .type = document_type_from_string(doc_type),
                             .title = std::move(title),
                             .chunk_id = chunk_id,
                             .token_estimate = token_estimate,
                             .start_offset = static_cast<size_t>(start_offset),
                             .end_offset = static_cast<size_t>(end_offset),
                             .text = content ? CompressionService::decompress(*content) : "",
                             .content_hash = std::move(content_hash),
                             .attributes = {}};
          record.attributes.sheet_name = sheet_name.value_or("");
          record.attributes.sheet_rows = sheet_rows.value_or(0);
          record.attributes.sheet_cols = sheet_cols.value_or(0);
          if (headers && !headers->empty()) {
            record.attributes.headers = nlohmann::json::parse(*headers).get<std::vector<std::string>>();
          }
          if (sheet_csv) {
            record.attributes.sheet_csv_bytes = CompressionService::decompress(*sheet_csv);
          }
          records.push_back(std::move(record));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("metadata read", db_path_, e));
  } catch (const nlohmann::json::exception &e) {
    throw MetadataStoreError("Metadata file " + db_path_.string() +
                             " has malformed headers: " + e.what());
  } catch (const CompressionError &e) {
    throw MetadataStoreError("Metadata file " + db_path_.string() + " has a corrupt blob: " + e.what());
  } catch (const std::invalid_argument &e) {
    throw MetadataStoreError("Metadata file " + db_path_.string() + ": " + e.what());
  }
  return records;
}

std::optional<MetadataFileInfo> MetadataStore::read_info() {
  std::optional<MetadataFileInfo> info;
  try {
    db_ << "SELECT entry_count, dimension, index_kind, vector_sha256, created_at FROM index_info "
           "WHERE id = 1;" >>
        [&](int64_t entry_count, int64_t dimension, std::string index_kind,
            std::string vector_sha256, std::string created_at) {
          info = MetadataFileInfo{.entry_count = static_cast<size_t>(entry_count),
                                  .dimension = static_cast<size_t>(dimension),
                                  .index_kind = std::move(index_kind),
                                  .vector_file_sha256 = std::move(vector_sha256),
                                  .created_at = std::move(created_at)};
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("metadata info read", db_path_, e));
  }
  return info;
}

size_t MetadataStore::count() {
  int64_t n = 0;
  try {
    db_ << "SELECT COUNT(*) FROM chunks;" >> n;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("metadata count", db_path_, e));
  }
  return static_cast<size_t>(n);
}

}  // namespace sift_core
