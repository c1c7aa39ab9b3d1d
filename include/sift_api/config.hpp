#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string ollama_url;
  std::string embedding_model;

  // Index files
  std::string index_path;
  std::string checkpoint_dir;
  std::string index_kind;

  // Chunking
  int target_tokens;
  int overlap_tokens;

  // Embedding batches and retries
  int batch_token_budget;
  int max_single_chunk_tokens;
  int max_attempts;
  int rate_limit_max_attempts;
  int initial_backoff_ms;
  int max_backoff_ms;

  // Retrieval
  int query_token_ceiling;
  double vector_weight;
  double lexical_weight;
  int default_top_k;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3040"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));

      config.index_path = json_config.value("index_path", std::string("./data/index/sift.faiss"));
      config.checkpoint_dir = json_config.value("checkpoint_dir", std::string("./data/checkpoints"));
      config.index_kind = json_config.value("index_kind", std::string("flat"));

      config.target_tokens = json_config.value("target_tokens", 500);
      config.overlap_tokens = json_config.value("overlap_tokens", 50);

      config.batch_token_budget = json_config.value("batch_token_budget", 4000);
      config.max_single_chunk_tokens = json_config.value("max_single_chunk_tokens", 4500);
      config.max_attempts = json_config.value("max_attempts", 5);
      config.rate_limit_max_attempts = json_config.value("rate_limit_max_attempts", 10);
      config.initial_backoff_ms = json_config.value("initial_backoff_ms", 1000);
      config.max_backoff_ms = json_config.value("max_backoff_ms", 30000);

      config.query_token_ceiling = json_config.value("query_token_ceiling", 7000);
      config.vector_weight = json_config.value("vector_weight", 0.5);
      config.lexical_weight = json_config.value("lexical_weight", 0.5);
      config.default_top_k = json_config.value("default_top_k", 5);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Config value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be host:port");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (index_path.empty()) {
      throw std::runtime_error("index_path cannot be empty");
    }
    if (checkpoint_dir.empty()) {
      throw std::runtime_error("checkpoint_dir cannot be empty");
    }
    if (index_kind != "flat" && index_kind != "hnsw") {
      throw std::runtime_error("index_kind must be \"flat\" or \"hnsw\"");
    }
    if (target_tokens <= 0) {
      throw std::runtime_error("target_tokens must be greater than 0");
    }
    if (overlap_tokens < 0) {
      throw std::runtime_error("overlap_tokens cannot be negative");
    }
    if (batch_token_budget <= 0 || max_single_chunk_tokens <= 0) {
      throw std::runtime_error("batch_token_budget and max_single_chunk_tokens must be greater than 0");
    }
    if (max_attempts < 1 || rate_limit_max_attempts < 1) {
      throw std::runtime_error("max_attempts and rate_limit_max_attempts must be at least 1");
    }
    if (initial_backoff_ms < 0 || max_backoff_ms < initial_backoff_ms) {
      throw std::runtime_error("backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms");
    }
    if (query_token_ceiling < 16) {
      throw std::runtime_error("query_token_ceiling must be at least 16");
    }
    if (vector_weight < 0.0 || lexical_weight < 0.0 || vector_weight + lexical_weight <= 0.0) {
      throw std::runtime_error("vector_weight and lexical_weight must be non-negative and not both 0");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
  }
};
