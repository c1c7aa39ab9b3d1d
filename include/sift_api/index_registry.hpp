#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>

#include "sift_core/index/index_store.hpp"

namespace sift_api {

/**
 * @class IndexRegistry
 * @brief Owns the index handle that queries run against.
 *
 * Published handles are never mutated again: build and append produce a new
 * handle and publish() swaps it in under the writer lock. A reader keeps the
 * snapshot it took alive for as long as it holds it.
 */
class IndexRegistry {
 public:
  IndexRegistry() = default;

  IndexRegistry(const IndexRegistry &) = delete;
  IndexRegistry &operator=(const IndexRegistry &) = delete;

  std::shared_ptr<const sift_core::IndexHandle> current() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_;
  }

  void publish(sift_core::IndexHandle handle) {
    auto next = std::make_shared<const sift_core::IndexHandle>(std::move(handle));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    current_ = std::move(next);
  }

  // Serializes indexing jobs; one build or append at a time.
  std::unique_lock<std::mutex> try_acquire_job() {
    return std::unique_lock<std::mutex>(job_mutex_, std::try_to_lock);
  }

 private:
  mutable std::shared_mutex mutex_;
  std::shared_ptr<const sift_core::IndexHandle> current_;
  std::mutex job_mutex_;
};

}  // namespace sift_api
