#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "sift_core/embedding/checkpoint_store.hpp"
#include "sift_core/llm/embedding_provider.hpp"
#include "sift_core/types/chunk.hpp"

namespace sift_core {

class EmbeddingCancelled : public std::exception {
 public:
  explicit EmbeddingCancelled(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct BatchingOptions {
  int batch_token_budget = 4000;
  // Chunks above this are truncated before embedding.
  int max_single_chunk_tokens = 4500;
};

struct RetryPolicy {
  int max_attempts = 5;
  int rate_limit_max_attempts = 10;
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{30000};
};

struct PlannedBatch {
  int batch_index = 0;
  size_t first_position = 0;
  std::vector<std::string> texts;
  int token_count = 0;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @class EmbeddingBatcher
 * @brief Embeds an ordered chunk list in token-budgeted batches, resumably.
 *
 * Every finished batch is written to the CheckpointStore before the next
 * batch is requested. Running the same chunk list again under the same
 * checkpoint id skips the recorded batches. Vectors come back in chunk order.
 */
class EmbeddingBatcher {
 public:
  EmbeddingBatcher(EmbeddingProvider &provider,
                   CheckpointStore &checkpoints,
                   BatchingOptions options = {},
                   RetryPolicy retry = {},
                   Sleeper sleeper = nullptr);

  EmbeddingBatcher(const EmbeddingBatcher &) = delete;
  EmbeddingBatcher &operator=(const EmbeddingBatcher &) = delete;

  std::vector<PlannedBatch> plan_batches(const std::vector<Chunk> &chunks) const;

  // Identifies a planned job; a checkpoint with another fingerprint is stale.
  static std::string fingerprint(const std::vector<PlannedBatch> &batches);

  /**
   * @throws EmbeddingError on a fatal provider failure or exhausted retries.
   * @throws EmbeddingCancelled if request_cancel() was called; checked between batches.
   * @throws CheckpointError if the checkpoint cannot be read or written.
   * In every case the batches finished so far stay in the checkpoint.
   */
  std::vector<std::vector<float>> embed(const std::vector<Chunk> &chunks,
                                        const std::string &checkpoint_id);

  // Stops the current or next embed() before its next batch. The request is
  // consumed when it takes effect, so later jobs run normally.
  void request_cancel() {
    cancel_requested_.store(true);
  }
  bool cancel_requested() const {
    return cancel_requested_.load();
  }

 private:
  std::vector<std::vector<float>> embed_with_retry(const PlannedBatch &batch);

  EmbeddingProvider &provider_;
  CheckpointStore &checkpoints_;
  BatchingOptions options_;
  RetryPolicy retry_;
  Sleeper sleeper_;
  std::atomic<bool> cancel_requested_{false};
};

}  // namespace sift_core
