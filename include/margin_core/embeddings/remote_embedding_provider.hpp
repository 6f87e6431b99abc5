#pragma once

#include <memory>
#include <string>

#include "margin_core/embeddings/embedding_provider.hpp"
#include "margin_core/net/remote_api_client.hpp"

namespace margin_core {

// Hosted embeddings via the Gemini batchEmbedContents endpoint. Inputs are
// sent in batches of at most batch_size texts.
class RemoteEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr size_t MAX_BATCH_SIZE = 100;

  RemoteEmbeddingProvider(std::shared_ptr<RemoteApiClient> api_client,
                          const std::string& model,
                          size_t batch_size = MAX_BATCH_SIZE);

  EmbeddingTier tier() const override {
    return EmbeddingTier::Remote;
  }

  // Available whenever an API key is configured.
  bool is_available() override;

  std::vector<Embedding> embed(const std::vector<std::string>& texts) override;

 private:
  std::vector<Embedding> embed_batch(const std::vector<std::string>& batch);

  std::shared_ptr<RemoteApiClient> api_client_;
  std::string model_;
  size_t batch_size_;
};

}  // namespace margin_core
