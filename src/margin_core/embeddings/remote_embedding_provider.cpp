#include "margin_core/embeddings/remote_embedding_provider.hpp"

#include <algorithm>
#include <utility>

namespace margin_core {

RemoteEmbeddingProvider::RemoteEmbeddingProvider(std::shared_ptr<RemoteApiClient> api_client,
                                                 const std::string& model,
                                                 size_t batch_size)
    : api_client_(std::move(api_client)),
      model_(model),
      batch_size_(std::clamp<size_t>(batch_size, 1, MAX_BATCH_SIZE)) {}

bool RemoteEmbeddingProvider::is_available() {
  return api_client_ && api_client_->has_credentials();
}

std::vector<Embedding> RemoteEmbeddingProvider::embed(const std::vector<std::string>& texts) {
  std::vector<Embedding> vectors;
  vectors.reserve(texts.size());

  for (size_t start = 0; start < texts.size(); start += batch_size_) {
    size_t end = std::min(start + batch_size_, texts.size());
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);
    std::vector<Embedding> batch_vectors = embed_batch(batch);
    for (auto& vector : batch_vectors) {
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

std::vector<Embedding> RemoteEmbeddingProvider::embed_batch(const std::vector<std::string>& batch) {
  const std::string model_path = "models/" + model_;

  nlohmann::json requests = nlohmann::json::array();
  for (const auto& text : batch) {
    nlohmann::json part = {{"text", text}};
    nlohmann::json content = {{"parts", nlohmann::json::array({part})}};
    requests.push_back({{"model", model_path}, {"content", content}});
  }
  nlohmann::json body = {{"requests", requests}};

  nlohmann::json response;
  try {
    response = api_client_->post(model_path + ":batchEmbedContents", body);
  } catch (const RemoteApiError& e) {
    throw EmbeddingError("Remote embedding request failed: " + std::string(e.what()));
  }

  if (!response.contains("embeddings") || !response["embeddings"].is_array()) {
    throw EmbeddingError("Remote embedding response does not contain embeddings");
  }
  const auto& embeddings = response["embeddings"];
  if (embeddings.size() != batch.size()) {
    throw EmbeddingError("Remote embedding response has " + std::to_string(embeddings.size()) +
                         " vectors for " + std::to_string(batch.size()) + " inputs");
  }

  std::vector<Embedding> vectors;
  vectors.reserve(embeddings.size());
  try {
    for (const auto& item : embeddings) {
      vectors.push_back(item.at("values").get<Embedding>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw EmbeddingError("Malformed remote embedding: " + std::string(e.what()));
  }
  return vectors;
}

}  // namespace margin_core
