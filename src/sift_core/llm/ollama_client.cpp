#include "sift_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "ollama.hpp"

namespace sift_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  // Queries fall back to lexical ranking, so an offline server is not fatal here.
  if (!ollama::is_running()) {
    std::cerr << "[Ollama] Server is not running at " << ollama_url_
              << "; embedding calls will fail until it is" << std::endl;
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    auto embeddings = json_response["embeddings"];
    if (embeddings.is_array()) {
      if (embeddings.size() > 0 && embeddings[0].is_array()) {
        // Array of arrays - take the first embedding vector
        return embeddings[0].get<std::vector<float>>();
      } else {
        return embeddings.get<std::vector<float>>();
      }
    } else {
      throw OllamaError("Embeddings field is not an array");
    }

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    try {
      vectors.push_back(get_embedding(text));
    } catch (const OllamaError &e) {
      throw EmbeddingError(classify_failure(e.what()), e.what());
    } catch (const nlohmann::json::exception &e) {
      throw EmbeddingError(EmbeddingError::Kind::Fatal,
                           "Malformed embedding response: " + std::string(e.what()));
    }
  }
  return vectors;
}

EmbeddingError::Kind OllamaClient::classify_failure(const std::string &message) {
  std::string lower = message;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto mentions = [&lower](const char *needle) { return lower.find(needle) != std::string::npos; };

  if (mentions("429") || mentions("rate limit") || mentions("too many requests")) {
    return EmbeddingError::Kind::RateLimited;
  }
  if (mentions("no response") || mentions("timeout") || mentions("timed out") ||
      mentions("connection") || mentions("unavailable") || mentions("502") ||
      mentions("503") || mentions("504") || mentions("server busy")) {
    return EmbeddingError::Kind::Transient;
  }
  return EmbeddingError::Kind::Fatal;
}

}  // namespace sift_core
