#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sift_core {

class CheckpointError : public std::exception {
 public:
  explicit CheckpointError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct CheckpointBatch {
  int batch_index = 0;
  // Position of the batch's first chunk in the job's chunk list.
  size_t first_position = 0;
  std::vector<std::vector<float>> vectors;
};

struct CheckpointState {
  std::string checkpoint_id;
  std::string fingerprint;
  size_t total_chunks = 0;
  std::map<int, CheckpointBatch> batches;

  size_t embedded_chunks() const {
    size_t n = 0;
    for (const auto &[index, batch] : batches) {
      n += batch.vectors.size();
    }
    return n;
  }
};

/**
 * @class CheckpointStore
 * @brief Durable, append-only record of the batches an embedding job finished.
 *
 * One SQLite file per checkpoint id under the store directory. save() returns
 * only after the batch row is committed with synchronous=FULL, so a crash right
 * after save() never loses that batch.
 */
class CheckpointStore {
 public:
  explicit CheckpointStore(std::filesystem::path directory);

  // Nothing recorded for id yields std::nullopt.
  std::optional<CheckpointState> load(const std::string &checkpoint_id) const;

  // Starts a fresh checkpoint, dropping whatever was recorded under the id.
  void begin(const std::string &checkpoint_id, const std::string &fingerprint, size_t total_chunks);

  // Throws CheckpointError if the batch index was already recorded.
  void save(const std::string &checkpoint_id, const CheckpointBatch &batch);

  void clear(const std::string &checkpoint_id);

  bool exists(const std::string &checkpoint_id) const;

  std::filesystem::path location(const std::string &checkpoint_id) const;

 private:
  std::filesystem::path directory_;
};

}  // namespace sift_core
