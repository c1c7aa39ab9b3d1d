#include "sift_core/services/indexing_service.hpp"

#include <algorithm>
#include <iostream>

#include "sift_core/chunking/chunk_strategy.hpp"
#include "sift_core/chunking/token_estimator.hpp"

namespace sift_core {

namespace {

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return is_space_byte(c); });
}

std::vector<ChunkRecord> to_records(const std::vector<Chunk> &chunks) {
  std::vector<ChunkRecord> records;
  records.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    records.push_back(ChunkRecord::from_chunk(chunk));
  }
  return records;
}

}  // namespace

IndexingService::IndexingService(std::shared_ptr<EmbeddingProvider> provider,
                                 std::shared_ptr<CheckpointStore> checkpoints,
                                 IndexStore index_store,
                                 IndexingOptions options,
                                 BatchingOptions batching,
                                 RetryPolicy retry,
                                 Sleeper sleeper)
    : provider_(std::move(provider)),
      checkpoints_(std::move(checkpoints)),
      index_store_(index_store),
      options_(std::move(options)),
      batcher_(*provider_, *checkpoints_, batching, retry, std::move(sleeper)) {}

std::vector<Chunk> IndexingService::chunk_documents(const std::vector<Document> &documents) const {
  std::vector<Chunk> chunks;
  for (const auto &document : documents) {
    if (is_blank(document.text)) {
      std::cout << "[Indexing] Skipping empty document " << document.source_id << std::endl;
      continue;
    }
    size_t kept = 0;
    for (auto &chunk : chunker_.chunk(document, options_.target_tokens, options_.overlap_tokens)) {
      if (is_blank(chunk.content)) {
        continue;
      }
      chunks.push_back(std::move(chunk));
      ++kept;
    }
    std::cout << "[Indexing] " << document.source_id << ": " << kept << " chunks ("
              << to_string(chunker_.resolve_kind(document)) << ")" << std::endl;
  }
  return chunks;
}

void IndexingService::fail_job(const std::string &job,
                               const std::string &checkpoint_id,
                               const std::string &reason) {
  const auto location = checkpoints_->location(checkpoint_id);
  std::string message = job + " failed: " + reason;
  if (checkpoints_->exists(checkpoint_id)) {
    message += ". Checkpoint saved at " + location.string() + ". Run again to resume.";
  }
  std::cerr << "[Indexing] " << message << std::endl;
  throw IndexingJobError(message, location);
}

IndexHandle IndexingService::finish_job(IndexHandle handle, const std::string &checkpoint_id) {
  index_store_.persist(handle, options_.index_path);

  const IndexHandle reloaded = index_store_.load(options_.index_path);
  if (!index_store_.verify(reloaded) || reloaded.size() != handle.size()) {
    throw IndexMismatchError("Saved index at " + options_.index_path.string() +
                             " does not match the index that was built");
  }
  std::cout << "[Indexing] Verified " << reloaded.vectors.size() << " vectors against "
            << reloaded.records.size() << " records" << std::endl;

  checkpoints_->clear(checkpoint_id);
  return handle;
}

IndexHandle IndexingService::build(const std::vector<Document> &documents) {
  try {
    const auto chunks = chunk_documents(documents);
    if (chunks.empty()) {
      fail_job("Build", BUILD_CHECKPOINT, "no indexable content in " + std::to_string(documents.size()) + " documents");
    }
    auto vectors = batcher_.embed(chunks, BUILD_CHECKPOINT);
    auto handle = index_store_.build(vectors, to_records(chunks));
    return finish_job(std::move(handle), BUILD_CHECKPOINT);
  } catch (const ChunkingError &e) {
    fail_job("Build", BUILD_CHECKPOINT, e.what());
  } catch (const EmbeddingError &e) {
    fail_job("Build", BUILD_CHECKPOINT, std::string(e.what()) + " (" + to_string(e.kind()) + ")");
  } catch (const EmbeddingCancelled &e) {
    fail_job("Build", BUILD_CHECKPOINT, e.what());
  } catch (const CheckpointError &e) {
    fail_job("Build", BUILD_CHECKPOINT, e.what());
  } catch (const IndexMismatchError &e) {
    fail_job("Build", BUILD_CHECKPOINT, e.what());
  } catch (const IndexStoreError &e) {
    fail_job("Build", BUILD_CHECKPOINT, e.what());
  } catch (const PersistenceError &e) {
    fail_job("Build", BUILD_CHECKPOINT, e.what());
  }
}

IndexHandle IndexingService::append(const std::vector<Document> &documents) {
  try {
    IndexHandle handle = index_store_.load(options_.index_path);
    if (!index_store_.verify(handle)) {
      fail_job("Append", APPEND_CHECKPOINT, "index at " + options_.index_path.string() + " is inconsistent");
    }

    const auto chunks = chunk_documents(documents);
    if (chunks.empty()) {
      std::cout << "[Indexing] Nothing to append" << std::endl;
      return handle;
    }
    auto vectors = batcher_.embed(chunks, APPEND_CHECKPOINT);
    index_store_.append(handle, vectors, to_records(chunks));
    return finish_job(std::move(handle), APPEND_CHECKPOINT);
  } catch (const ChunkingError &e) {
    fail_job("Append", APPEND_CHECKPOINT, e.what());
  } catch (const EmbeddingError &e) {
    fail_job("Append", APPEND_CHECKPOINT, std::string(e.what()) + " (" + to_string(e.kind()) + ")");
  } catch (const EmbeddingCancelled &e) {
    fail_job("Append", APPEND_CHECKPOINT, e.what());
  } catch (const CheckpointError &e) {
    fail_job("Append", APPEND_CHECKPOINT, e.what());
  } catch (const IndexMismatchError &e) {
    fail_job("Append", APPEND_CHECKPOINT, e.what());
  } catch (const IndexStoreError &e) {
    fail_job("Append", APPEND_CHECKPOINT, e.what());
  } catch (const PersistenceError &e) {
    fail_job("Append", APPEND_CHECKPOINT, e.what());
  }
}

}  // namespace sift_core
