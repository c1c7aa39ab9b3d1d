#include "sift_core/embedding/embedding_batcher.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include "sift_core/chunking/token_estimator.hpp"
#include "sift_core/utils/sha256.hpp"

namespace sift_core {

EmbeddingBatcher::EmbeddingBatcher(EmbeddingProvider &provider,
                                   CheckpointStore &checkpoints,
                                   BatchingOptions options,
                                   RetryPolicy retry,
                                   Sleeper sleeper)
    : provider_(provider),
      checkpoints_(checkpoints),
      options_(options),
      retry_(retry),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::vector<PlannedBatch> EmbeddingBatcher::plan_batches(const std::vector<Chunk> &chunks) const {
  std::vector<PlannedBatch> batches;
  PlannedBatch current;

  for (size_t position = 0; position < chunks.size(); ++position) {
    const Chunk &chunk = chunks[position];
    std::string text = chunk.content;
    int tokens = estimate_tokens(text);
    if (tokens > options_.max_single_chunk_tokens) {
      text = truncate_to_token_budget(text, options_.max_single_chunk_tokens);
      const int kept = estimate_tokens(text);
      std::cerr << "[Embedder] Truncated " << chunk.title << " from " << tokens << " to " << kept
                << " tokens for embedding; the tail is not represented in its vector." << std::endl;
      tokens = kept;
    }

    if (!current.texts.empty() && current.token_count + tokens > options_.batch_token_budget) {
      batches.push_back(std::move(current));
      current = PlannedBatch{};
    }
    if (current.texts.empty()) {
      current.batch_index = static_cast<int>(batches.size());
      current.first_position = position;
    }
    current.texts.push_back(std::move(text));
    current.token_count += tokens;
  }
  if (!current.texts.empty()) {
    batches.push_back(std::move(current));
  }
  return batches;
}

std::string EmbeddingBatcher::fingerprint(const std::vector<PlannedBatch> &batches) {
  Sha256 hash;
  for (const auto &batch : batches) {
    hash.update("batch:" + std::to_string(batch.batch_index) + ":" +
                std::to_string(batch.first_position) + ":" + std::to_string(batch.texts.size()) +
                "\n");
    for (const auto &text : batch.texts) {
      hash.update(std::to_string(text.size()) + ":");
      hash.update(text);
    }
  }
  return hash.hex_digest();
}

std::vector<std::vector<float>> EmbeddingBatcher::embed(const std::vector<Chunk> &chunks,
                                                        const std::string &checkpoint_id) {
  if (chunks.empty()) {
    return {};
  }

  const auto batches = plan_batches(chunks);
  const std::string job_fingerprint = fingerprint(batches);

  auto state = checkpoints_.load(checkpoint_id);
  if (state && (state->fingerprint != job_fingerprint || state->total_chunks != chunks.size())) {
    std::cerr << "[Checkpoint] Discarding stale checkpoint '" << checkpoint_id
              << "': it was recorded for a different chunk list." << std::endl;
    state.reset();
  }
  if (!state) {
    checkpoints_.begin(checkpoint_id, job_fingerprint, chunks.size());
    state = CheckpointState{.checkpoint_id = checkpoint_id,
                            .fingerprint = job_fingerprint,
                            .total_chunks = chunks.size(),
                            .batches = {}};
  } else {
    std::cout << "[Checkpoint] Resuming '" << checkpoint_id << "': " << state->batches.size()
              << " of " << batches.size() << " batches already embedded." << std::endl;
  }

  std::vector<std::vector<float>> vectors(chunks.size());
  size_t dimension = 0;

  auto place = [&](const PlannedBatch &batch, std::vector<std::vector<float>> batch_vectors) {
    if (batch_vectors.size() != batch.texts.size()) {
      throw EmbeddingError(EmbeddingError::Kind::Fatal,
                           "Batch " + std::to_string(batch.batch_index) + " returned " +
                               std::to_string(batch_vectors.size()) + " vectors for " +
                               std::to_string(batch.texts.size()) + " texts");
    }
    for (const auto &v : batch_vectors) {
      if (v.empty()) {
        throw EmbeddingError(EmbeddingError::Kind::Fatal,
                             "Batch " + std::to_string(batch.batch_index) + " returned an empty vector");
      }
      if (dimension == 0) {
        dimension = v.size();
      } else if (v.size() != dimension) {
        throw EmbeddingError(EmbeddingError::Kind::Fatal,
                             "Batch " + std::to_string(batch.batch_index) + " returned dimension " +
                                 std::to_string(v.size()) + ", expected " +
                                 std::to_string(dimension));
      }
    }
    return batch_vectors;
  };

  for (const auto &batch : batches) {
    auto recorded = state->batches.find(batch.batch_index);
    if (recorded != state->batches.end()) {
      if (recorded->second.first_position != batch.first_position ||
          recorded->second.vectors.size() != batch.texts.size()) {
        throw CheckpointError("Checkpoint '" + checkpoint_id + "' batch " +
                              std::to_string(batch.batch_index) +
                              " does not line up with the planned batch; clear " +
                              checkpoints_.location(checkpoint_id).string() + " and run again");
      }
      auto restored = place(batch, std::move(recorded->second.vectors));
      std::move(restored.begin(), restored.end(),
                vectors.begin() + static_cast<std::ptrdiff_t>(batch.first_position));
      continue;
    }

    if (cancel_requested_.exchange(false)) {
      throw EmbeddingCancelled("Embedding cancelled before batch " +
                               std::to_string(batch.batch_index + 1) + " of " +
                               std::to_string(batches.size()) + "; checkpoint kept at " +
                               checkpoints_.location(checkpoint_id).string());
    }

    auto embedded = place(batch, embed_with_retry(batch));
    checkpoints_.save(checkpoint_id, CheckpointBatch{.batch_index = batch.batch_index,
                                                     .first_position = batch.first_position,
                                                     .vectors = embedded});
    std::move(embedded.begin(), embedded.end(),
              vectors.begin() + static_cast<std::ptrdiff_t>(batch.first_position));
    std::cout << "[Embedder] Batch " << batch.batch_index + 1 << "/" << batches.size() << " ("
              << batch.texts.size() << " chunks, ~" << batch.token_count << " tokens) embedded."
              << std::endl;
  }

  return vectors;
}

std::vector<std::vector<float>> EmbeddingBatcher::embed_with_retry(const PlannedBatch &batch) {
  int rate_limited_attempts = 0;
  int transient_attempts = 0;
  auto backoff = retry_.initial_backoff;

  while (true) {
    try {
      return provider_.embed_batch(batch.texts);
    } catch (const EmbeddingError &e) {
      int attempts = 0;
      int limit = 0;
      switch (e.kind()) {
        case EmbeddingError::Kind::Fatal:
          throw;
        case EmbeddingError::Kind::RateLimited:
          attempts = ++rate_limited_attempts;
          limit = retry_.rate_limit_max_attempts;
          break;
        case EmbeddingError::Kind::Transient:
          attempts = ++transient_attempts;
          limit = retry_.max_attempts;
          break;
      }
      if (attempts >= limit) {
        throw EmbeddingError(e.kind(), "Batch " + std::to_string(batch.batch_index) +
                                           " failed after " + std::to_string(attempts) + " " +
                                           to_string(e.kind()) + " attempts: " + e.what());
      }
      std::cerr << "[Embedder] Batch " << batch.batch_index << " " << to_string(e.kind())
                << " failure (attempt " << attempts << "/" << limit << "), retrying in "
                << backoff.count() << " ms: " << e.what() << std::endl;
      sleeper_(backoff);
      backoff = std::min(backoff * 2, retry_.max_backoff);
    }
  }
}

}  // namespace sift_core
