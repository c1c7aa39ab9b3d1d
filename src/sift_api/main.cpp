#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "sift_api/config.hpp"
#include "sift_api/index_registry.hpp"
#include "sift_api/routes.hpp"
#include "sift_api/server.hpp"
#include "sift_core/embedding/checkpoint_store.hpp"
#include "sift_core/extractors/document_extractor_factory.hpp"
#include "sift_core/index/index_store.hpp"
#include "sift_core/llm/ollama_client.hpp"
#include "sift_core/services/indexing_service.hpp"
#include "sift_core/services/search_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main() {
  try {
    Config config = Config::from_file("siftrc.json");

    std::cout << "Starting Sift API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Index Path: " << config.index_path << " (" << config.index_kind << ")" << std::endl;
    std::cout << "Checkpoint Dir: " << config.checkpoint_dir << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;

    auto ollama_client = std::make_shared<sift_core::OllamaClient>(config.ollama_url, config.embedding_model);
    auto checkpoints = std::make_shared<sift_core::CheckpointStore>(config.checkpoint_dir);
    const sift_core::IndexStore index_store(sift_core::index_kind_from_string(config.index_kind));

    auto indexing_service = std::make_shared<sift_core::IndexingService>(
        ollama_client, checkpoints, index_store,
        sift_core::IndexingOptions{.target_tokens = config.target_tokens,
                                   .overlap_tokens = config.overlap_tokens,
                                   .index_path = config.index_path},
        sift_core::BatchingOptions{.batch_token_budget = config.batch_token_budget,
                                   .max_single_chunk_tokens = config.max_single_chunk_tokens},
        sift_core::RetryPolicy{.max_attempts = config.max_attempts,
                               .rate_limit_max_attempts = config.rate_limit_max_attempts,
                               .initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms),
                               .max_backoff = std::chrono::milliseconds(config.max_backoff_ms)});
    auto search_service = std::make_shared<sift_core::SearchService>(
        ollama_client, sift_core::RetrievalOptions{.query_token_ceiling = config.query_token_ceiling,
                                                   .vector_weight = config.vector_weight,
                                                   .lexical_weight = config.lexical_weight});
    auto extractor_factory = std::make_shared<sift_core::DocumentExtractorFactory>();
    auto registry = std::make_shared<sift_api::IndexRegistry>();

    // Serve the saved index, if any, until the next build or append replaces it.
    if (std::filesystem::exists(config.index_path)) {
      try {
        registry->publish(index_store.load(config.index_path));
        std::cout << "Loaded index with " << registry->current()->size() << " entries" << std::endl;
      } catch (const sift_core::PersistenceError &e) {
        std::cerr << "Warning: Saved index not loaded: " << e.what() << std::endl;
      }
    } else {
      std::cout << "No saved index yet; POST /index/build to create one." << std::endl;
    }

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    sift_api::Server server(host, port);
    sift_api::Routes routes(registry, indexing_service, search_service, extractor_factory, index_store,
                            config.default_top_k);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    indexing_service->request_cancel();
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
