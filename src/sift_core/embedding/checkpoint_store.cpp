#include "sift_core/embedding/checkpoint_store.hpp"

#include <chrono>
#include <cstring>
#include <iostream>

#include "sift_core/db/sqlite_error_utils.hpp"
#include "sift_core/db/transaction.hpp"

namespace sift_core {

namespace {

void create_schema(sqlite::database &db) {
  db << R"(
    CREATE TABLE IF NOT EXISTS job (
      id INTEGER PRIMARY KEY CHECK (id = 1),
      checkpoint_id TEXT NOT NULL,
      fingerprint TEXT NOT NULL,
      total_chunks INTEGER NOT NULL,
      created_at INTEGER NOT NULL
    );
  )";
  db << R"(
    CREATE TABLE IF NOT EXISTS batches (
      batch_index INTEGER PRIMARY KEY,
      first_position INTEGER NOT NULL,
      vector_count INTEGER NOT NULL,
      dimension INTEGER NOT NULL,
      vectors BLOB
    );
  )";
}

std::vector<char> pack_vectors(const std::vector<std::vector<float>> &vectors, size_t dimension) {
  std::vector<char> blob(vectors.size() * dimension * sizeof(float));
  char *out = blob.data();
  for (const auto &v : vectors) {
    std::memcpy(out, v.data(), dimension * sizeof(float));
    out += dimension * sizeof(float);
  }
  return blob;
}

}  // namespace

CheckpointStore::CheckpointStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path CheckpointStore::location(const std::string &checkpoint_id) const {
  return directory_ / (checkpoint_id + ".checkpoint.db");
}

bool CheckpointStore::exists(const std::string &checkpoint_id) const {
  return std::filesystem::exists(location(checkpoint_id));
}

std::optional<CheckpointState> CheckpointStore::load(const std::string &checkpoint_id) const {
  const auto path = location(checkpoint_id);
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }

  try {
    auto db = open_database_file(path.string(), true);
    create_schema(db);

    std::optional<CheckpointState> state;
    db << "SELECT checkpoint_id, fingerprint, total_chunks FROM job WHERE id = 1;" >>
        [&](std::string id, std::string fingerprint, int64_t total_chunks) {
          state = CheckpointState{.checkpoint_id = std::move(id),
                                  .fingerprint = std::move(fingerprint),
                                  .total_chunks = static_cast<size_t>(total_chunks),
                                  .batches = {}};
        };
    if (!state) {
      return std::nullopt;
    }

    db << "SELECT batch_index, first_position, vector_count, dimension, vectors "
          "FROM batches ORDER BY batch_index;" >>
        [&](int batch_index, int64_t first_position, int64_t vector_count, int64_t dimension,
            std::optional<std::vector<char>> blob) {
          const size_t count = static_cast<size_t>(vector_count);
          const size_t dim = static_cast<size_t>(dimension);
          const size_t expected = count * dim * sizeof(float);
          const size_t actual = blob ? blob->size() : 0;
          if (actual != expected) {
            throw CheckpointError("Checkpoint " + path.string() + " batch " +
                                  std::to_string(batch_index) + " holds " + std::to_string(actual) +
                                  " bytes, expected " + std::to_string(expected));
          }
          CheckpointBatch batch{.batch_index = batch_index,
                                .first_position = static_cast<size_t>(first_position),
                                .vectors = {}};
          batch.vectors.reserve(count);
          for (size_t i = 0; i < count; ++i) {
            std::vector<float> v(dim);
            std::memcpy(v.data(), blob->data() + i * dim * sizeof(float), dim * sizeof(float));
            batch.vectors.push_back(std::move(v));
          }
          state->batches.emplace(batch_index, std::move(batch));
        };
    return state;
  } catch (const sqlite::sqlite_exception &e) {
    throw CheckpointError(format_db_error("checkpoint load", path, e));
  }
}

void CheckpointStore::begin(const std::string &checkpoint_id,
                            const std::string &fingerprint,
                            size_t total_chunks) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw CheckpointError("Cannot create checkpoint directory " + directory_.string() + ": " +
                          ec.message());
  }
  clear(checkpoint_id);

  const auto path = location(checkpoint_id);
  try {
    auto db = open_database_file(path.string(), true);
    create_schema(db);
    const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    Transaction tx(db);
    db << "INSERT INTO job (id, checkpoint_id, fingerprint, total_chunks, created_at) "
          "VALUES (1, ?, ?, ?, ?);"
       << checkpoint_id << fingerprint << static_cast<int64_t>(total_chunks) << now;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw CheckpointError(format_db_error("checkpoint begin", path, e));
  }
}

void CheckpointStore::save(const std::string &checkpoint_id, const CheckpointBatch &batch) {
  const auto path = location(checkpoint_id);
  if (!std::filesystem::exists(path)) {
    throw CheckpointError("Checkpoint " + checkpoint_id + " was not started at " + path.string());
  }

  const size_t dimension = batch.vectors.empty() ? 0 : batch.vectors.front().size();
  for (const auto &v : batch.vectors) {
    if (v.size() != dimension) {
      throw CheckpointError("Batch " + std::to_string(batch.batch_index) +
                            " mixes vector dimensions " + std::to_string(dimension) + " and " +
                            std::to_string(v.size()));
    }
  }

  try {
    auto db = open_database_file(path.string(), true);
    Transaction tx(db);
    db << "INSERT INTO batches (batch_index, first_position, vector_count, dimension, vectors) "
          "VALUES (?, ?, ?, ?, ?);"
       << batch.batch_index << static_cast<int64_t>(batch.first_position)
       << static_cast<int64_t>(batch.vectors.size()) << static_cast<int64_t>(dimension)
       << pack_vectors(batch.vectors, dimension);
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    if (classify_sqlite_code(e.get_code()) == DbErrorKind::Constraint) {
      throw CheckpointError("Batch " + std::to_string(batch.batch_index) +
                            " is already recorded in " + path.string());
    }
    throw CheckpointError(format_db_error("checkpoint save", path, e));
  }
}

void CheckpointStore::clear(const std::string &checkpoint_id) {
  const auto path = location(checkpoint_id);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw CheckpointError("Cannot remove checkpoint " + path.string() + ": " + ec.message());
  }
  // Rollback journal left by an interrupted transaction.
  std::filesystem::remove(path.string() + "-journal", ec);
  if (ec) {
    std::cerr << "[Checkpoint] Could not remove journal of " << path << ": " << ec.message()
              << std::endl;
  }
}

}  // namespace sift_core
