#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sift_core/chunking/structural_chunker.hpp"
#include "sift_core/embedding/checkpoint_store.hpp"
#include "sift_core/embedding/embedding_batcher.hpp"
#include "sift_core/index/index_store.hpp"
#include "sift_core/llm/embedding_provider.hpp"
#include "sift_core/types/document.hpp"

namespace sift_core {

// A build or append that stopped; any finished batches are in the checkpoint.
class IndexingJobError : public std::exception {
 public:
  IndexingJobError(const std::string &message, std::filesystem::path checkpoint_location)
      : message_(message), checkpoint_location_(std::move(checkpoint_location)) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  const std::filesystem::path &checkpoint_location() const noexcept {
    return checkpoint_location_;
  }

 private:
  std::string message_;
  std::filesystem::path checkpoint_location_;
};

struct IndexingOptions {
  int target_tokens = 500;
  int overlap_tokens = 50;
  // Vector file of the index; the metadata file sits next to it.
  std::filesystem::path index_path = "index/sift.faiss";
};

class IndexingService {
 public:
  static constexpr const char *BUILD_CHECKPOINT = "build";
  static constexpr const char *APPEND_CHECKPOINT = "append";

  IndexingService(std::shared_ptr<EmbeddingProvider> provider,
                  std::shared_ptr<CheckpointStore> checkpoints,
                  IndexStore index_store,
                  IndexingOptions options,
                  BatchingOptions batching = {},
                  RetryPolicy retry = {},
                  Sleeper sleeper = nullptr);

  IndexingService(const IndexingService &) = delete;
  IndexingService &operator=(const IndexingService &) = delete;

  // Chunks, embeds, builds, saves to index_path, verifies, clears the checkpoint.
  IndexHandle build(const std::vector<Document> &documents);

  // Same as build, but extends the index saved at index_path.
  IndexHandle append(const std::vector<Document> &documents);

  // Skips empty documents and whitespace-only chunks.
  std::vector<Chunk> chunk_documents(const std::vector<Document> &documents) const;

  // Stops the running job at the next batch boundary.
  void request_cancel() {
    batcher_.request_cancel();
  }

 private:
  IndexHandle finish_job(IndexHandle handle, const std::string &checkpoint_id);
  [[noreturn]] void fail_job(const std::string &job, const std::string &checkpoint_id, const std::string &reason);

  std::shared_ptr<EmbeddingProvider> provider_;
  std::shared_ptr<CheckpointStore> checkpoints_;
  IndexStore index_store_;
  IndexingOptions options_;
  StructuralChunker chunker_;
  EmbeddingBatcher batcher_;
};

}  // namespace sift_core
