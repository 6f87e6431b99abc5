#include "margin_core/embeddings/ollama_embedding_provider.hpp"

#include <iostream>

#include "ollama.hpp"

#include "margin_core/llm/ollama_client_lock.hpp"

namespace margin_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string& ollama_url,
                                                 const std::string& embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {}

bool OllamaEmbeddingProvider::is_available() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = std::chrono::steady_clock::now();
  if (available_ && now - checked_at_ < AVAILABILITY_TTL) {
    return *available_;
  }
  available_ = check_server();
  checked_at_ = now;
  return *available_;
}

bool OllamaEmbeddingProvider::check_server() {
  std::lock_guard<std::mutex> client_lock(ollama_client_mutex());
  try {
    ollama::setServerURL(ollama_url_);
    if (!ollama::is_running()) {
      return false;
    }
    for (const auto& model : ollama::list_models()) {
      // Tags are reported as "<name>:<tag>"
      if (model == embedding_model_ || model.rfind(embedding_model_ + ":", 0) == 0) {
        return true;
      }
    }
    std::cerr << "[Ollama] Model '" << embedding_model_ << "' is not pulled on " << ollama_url_
              << std::endl;
    return false;
  } catch (const ollama::exception& e) {
    std::cerr << "[Ollama] Availability check failed: " << e.what() << std::endl;
    return false;
  }
}

std::vector<Embedding> OllamaEmbeddingProvider::embed(const std::vector<std::string>& texts) {
  std::lock_guard<std::mutex> client_lock(ollama_client_mutex());
  ollama::setServerURL(ollama_url_);

  std::vector<Embedding> vectors;
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(get_embedding(text));
  }
  return vectors;
}

Embedding OllamaEmbeddingProvider::get_embedding(const std::string& text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    // /api/embed answers with "embeddings": [[...]], the legacy endpoint with "embedding": [...]
    Embedding vector;
    if (json_response.contains("embeddings") && json_response["embeddings"].is_array() &&
        !json_response["embeddings"].empty()) {
      vector = json_response["embeddings"][0].get<Embedding>();
    } else if (json_response.contains("embedding")) {
      vector = json_response["embedding"].get<Embedding>();
    } else {
      throw EmbeddingError("Ollama response does not contain an embedding");
    }

    if (vector.empty()) {
      throw EmbeddingError("Ollama returned an empty embedding");
    }
    return vector;
  } catch (const ollama::exception& e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception& e) {
    throw EmbeddingError("Malformed Ollama embedding response: " + std::string(e.what()));
  }
}

}  // namespace margin_core
