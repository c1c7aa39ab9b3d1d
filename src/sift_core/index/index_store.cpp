#include "sift_core/index/index_store.hpp"

#include <atomic>
#include <iterator>
#include <iostream>

#include "sift_core/utils/sha256.hpp"

namespace sift_core {

namespace {

uint64_t next_revision() {
  static std::atomic<uint64_t> counter{0};
  return ++counter;
}

void require_matching_counts(const std::vector<std::vector<float>> &vectors,
                             const std::vector<ChunkRecord> &records) {
  if (vectors.size() != records.size()) {
    throw IndexMismatchError("Got " + std::to_string(vectors.size()) + " vectors for " +
                             std::to_string(records.size()) + " records");
  }
}

void remove_if_present(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw PersistenceError("Cannot remove " + path.string() + ": " + ec.message());
  }
}

}  // namespace

std::filesystem::path IndexStore::metadata_path_for(const std::filesystem::path &vector_path) {
  auto meta = vector_path;
  meta.replace_extension(".meta.db");
  return meta;
}

IndexHandle IndexStore::build(const std::vector<std::vector<float>> &vectors,
                              std::vector<ChunkRecord> records) const {
  require_matching_counts(vectors, records);
  if (vectors.empty()) {
    throw IndexStoreError("Cannot build an index from zero entries");
  }

  try {
    VectorIndex index(vectors.front().size(), kind_);
    index.add(vectors);
    IndexHandle handle{.vectors = std::move(index), .records = std::move(records), .revision = next_revision()};
    std::cout << "[IndexStore] Built " << to_string(kind_) << " index with " << handle.size()
              << " entries of dimension " << handle.vectors.dimension() << std::endl;
    return handle;
  } catch (const VectorIndexError &e) {
    throw IndexMismatchError(std::string("Cannot build index: ") + e.what());
  }
}

void IndexStore::append(IndexHandle &handle,
                        const std::vector<std::vector<float>> &vectors,
                        std::vector<ChunkRecord> records) const {
  require_matching_counts(vectors, records);
  if (vectors.empty()) {
    return;
  }
  if (!verify(handle)) {
    throw IndexMismatchError("Refusing to append to an inconsistent index");
  }
  for (const auto &v : vectors) {
    if (v.size() != handle.vectors.dimension()) {
      throw IndexMismatchError("Appended vector has dimension " + std::to_string(v.size()) +
                               ", index has " + std::to_string(handle.vectors.dimension()));
    }
  }

  try {
    handle.vectors.add(vectors);
  } catch (const VectorIndexError &e) {
    throw IndexStoreError(std::string("Append failed: ") + e.what());
  }
  handle.records.insert(handle.records.end(), std::make_move_iterator(records.begin()),
                        std::make_move_iterator(records.end()));
  handle.revision = next_revision();
  std::cout << "[IndexStore] Appended " << vectors.size() << " entries; index now holds "
            << handle.size() << std::endl;
}

void IndexStore::persist(const IndexHandle &handle, const std::filesystem::path &vector_path) const {
  if (!verify(handle)) {
    throw IndexMismatchError("Refusing to save an inconsistent index to " + vector_path.string());
  }

  const auto meta_path = metadata_path_for(vector_path);
  const std::filesystem::path vector_tmp = vector_path.string() + ".tmp";
  const std::filesystem::path meta_tmp = meta_path.string() + ".tmp";

  try {
    if (vector_path.has_parent_path()) {
      std::filesystem::create_directories(vector_path.parent_path());
    }
    remove_if_present(vector_tmp);
    remove_if_present(meta_tmp);

    handle.vectors.write(vector_tmp);
    const MetadataFileInfo info{.entry_count = handle.size(),
                                .dimension = handle.vectors.dimension(),
                                .index_kind = to_string(handle.vectors.kind()),
                                .vector_file_sha256 = sha256_file_hex(vector_tmp),
                                .created_at = MetadataStore::time_point_to_string(
                                    std::chrono::system_clock::now())};
    {
      MetadataStore store(meta_tmp);
      store.write(handle.records, info);
    }

    std::filesystem::rename(vector_tmp, vector_path);
    std::filesystem::rename(meta_tmp, meta_path);
  } catch (const VectorIndexError &e) {
    throw PersistenceError(e.what());
  } catch (const MetadataStoreError &e) {
    throw PersistenceError(e.what());
  } catch (const HashingError &e) {
    throw PersistenceError(e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    throw PersistenceError("Failed to save index to " + vector_path.string() + ": " + e.what());
  }
  std::cout << "[IndexStore] Saved " << handle.size() << " entries to " << vector_path << std::endl;
}

IndexHandle IndexStore::load(const std::filesystem::path &vector_path) const {
  const auto meta_path = metadata_path_for(vector_path);
  if (!std::filesystem::exists(vector_path)) {
    throw PersistenceError("Vector file not found: " + vector_path.string());
  }
  if (!std::filesystem::exists(meta_path)) {
    throw PersistenceError("Metadata file not found: " + meta_path.string());
  }

  try {
    MetadataStore store(meta_path);
    const auto info = store.read_info();
    if (!info) {
      throw PersistenceError("Metadata file " + meta_path.string() + " has no index info");
    }
    if (sha256_file_hex(vector_path) != info->vector_file_sha256) {
      throw PersistenceError("Vector file " + vector_path.string() +
                             " is not the file " + meta_path.string() + " was written with");
    }

    VectorIndex vectors = VectorIndex::read(vector_path);
    if (vectors.dimension() != info->dimension) {
      throw PersistenceError("Vector file dimension " + std::to_string(vectors.dimension()) +
                             " does not match recorded dimension " + std::to_string(info->dimension));
    }

    auto records = store.read_records();
    if (records.size() != vectors.size() || records.size() != info->entry_count) {
      std::cerr << "[IndexStore] Warning: " << vector_path << " holds " << vectors.size()
                << " vectors but " << records.size() << " records (recorded "
                << info->entry_count << ")" << std::endl;
    }

    return IndexHandle{.vectors = std::move(vectors), .records = std::move(records), .revision = next_revision()};
  } catch (const VectorIndexError &e) {
    throw PersistenceError(e.what());
  } catch (const MetadataStoreError &e) {
    throw PersistenceError(e.what());
  } catch (const HashingError &e) {
    throw PersistenceError(e.what());
  }
}

VerifyReport IndexStore::verify_report(const IndexHandle &handle) const {
  VerifyReport report{.consistent = true,
                      .vector_count = handle.vectors.size(),
                      .metadata_count = handle.records.size(),
                      .dimension = handle.vectors.dimension(),
                      .problems = {}};
  if (report.vector_count != report.metadata_count) {
    report.problems.push_back("vector count " + std::to_string(report.vector_count) +
                              " != metadata count " + std::to_string(report.metadata_count));
  }
  for (size_t i = 0; i < handle.records.size(); ++i) {
    const auto &record = handle.records[i];
    if (record.end_offset < record.start_offset) {
      report.problems.push_back("record " + std::to_string(i) + " has an inverted byte range");
    }
  }
  report.consistent = report.problems.empty();
  return report;
}

bool IndexStore::verify(const IndexHandle &handle) const {
  const auto report = verify_report(handle);
  for (const auto &problem : report.problems) {
    std::cerr << "[IndexStore] Verify: " << problem << std::endl;
  }
  return report.consistent;
}

}  // namespace sift_core
