#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "margin_core/embeddings/embedding_provider.hpp"

namespace margin_core {

// On-device embeddings through a local Ollama server.
class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(const std::string& ollama_url, const std::string& embedding_model);

  OllamaEmbeddingProvider(const OllamaEmbeddingProvider&) = delete;
  OllamaEmbeddingProvider& operator=(const OllamaEmbeddingProvider&) = delete;

  EmbeddingTier tier() const override {
    return EmbeddingTier::Local;
  }

  // True when the server answers and the model is pulled. Cached briefly.
  bool is_available() override;

  std::vector<Embedding> embed(const std::vector<std::string>& texts) override;

 private:
  Embedding get_embedding(const std::string& text);
  bool check_server();

  static constexpr std::chrono::seconds AVAILABILITY_TTL{30};

  std::string ollama_url_;
  std::string embedding_model_;

  // Guards the availability cache
  std::mutex mutex_;
  std::optional<bool> available_;
  std::chrono::steady_clock::time_point checked_at_;
};

}  // namespace margin_core
