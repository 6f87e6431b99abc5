#include "margin_core/embeddings/provider_factory.hpp"

#include <iostream>
#include <utility>

#include "margin_core/embeddings/hash_embedding_provider.hpp"
#include "margin_core/embeddings/ollama_embedding_provider.hpp"
#include "margin_core/embeddings/remote_embedding_provider.hpp"
#include "margin_core/llm/ollama_text_generator.hpp"
#include "margin_core/llm/remote_text_generator.hpp"
#include "margin_core/net/remote_api_client.hpp"

namespace margin_core {

namespace {

std::shared_ptr<RemoteApiClient> make_api_client(const Settings& settings,
                                                 std::shared_ptr<HttpClient> http_client,
                                                 Sleeper sleeper) {
  RemoteApiOptions options{
      .endpoint = settings.remote_endpoint,
      .api_key = settings.remote_api_key,
      .timeout_seconds = settings.remote_timeout_seconds,
      .retry = {.max_attempts = settings.remote_max_attempts,
                .base_delay = std::chrono::milliseconds(settings.remote_base_delay_ms)},
  };
  return std::make_shared<RemoteApiClient>(std::move(http_client), std::move(options), std::move(sleeper));
}

}  // namespace

ProviderFactory::ProviderFactory(std::shared_ptr<SettingsStore> settings)
    : settings_(std::move(settings)), http_client_(std::make_shared<HttpClient>()) {}

Settings ProviderFactory::refresh_locked() {
  Settings current = settings_->current();
  std::uint64_t version = settings_->version();
  if (version != cached_version_) {
    if (cached_version_ != 0) {
      std::cout << "[ProviderFactory] Settings changed, rebuilding provider clients" << std::endl;
    }
    clients_ = CachedClients{};
    cached_version_ = version;
  }
  return current;
}

std::shared_ptr<EmbeddingProvider> ProviderFactory::local_provider() {
  std::lock_guard<std::mutex> lock(mutex_);
  Settings settings = refresh_locked();
  if (!clients_.local) {
    clients_.local = create_local_provider(settings);
  }
  return clients_.local;
}

std::shared_ptr<EmbeddingProvider> ProviderFactory::remote_provider() {
  std::lock_guard<std::mutex> lock(mutex_);
  Settings settings = refresh_locked();
  if (!clients_.remote) {
    clients_.remote = create_remote_provider(settings);
  }
  return clients_.remote;
}

std::shared_ptr<EmbeddingProvider> ProviderFactory::hash_provider() {
  std::lock_guard<std::mutex> lock(mutex_);
  Settings settings = refresh_locked();
  if (!clients_.hash) {
    clients_.hash = create_hash_provider(settings);
  }
  return clients_.hash;
}

std::shared_ptr<TextGenerator> ProviderFactory::text_generator() {
  std::lock_guard<std::mutex> lock(mutex_);
  Settings settings = refresh_locked();
  if (!clients_.generator) {
    clients_.generator = create_text_generator(settings);
  }
  return clients_.generator;
}

std::shared_ptr<EmbeddingProvider> ProviderFactory::create_local_provider(const Settings& settings) {
  return std::make_shared<OllamaEmbeddingProvider>(settings.ollama_url, settings.local_embedding_model);
}

std::shared_ptr<EmbeddingProvider> ProviderFactory::create_remote_provider(const Settings& settings) {
  return std::make_shared<RemoteEmbeddingProvider>(make_api_client(settings, http_client(), sleeper()),
                                                   settings.remote_embedding_model,
                                                   static_cast<size_t>(settings.remote_batch_size));
}

std::shared_ptr<EmbeddingProvider> ProviderFactory::create_hash_provider(const Settings& settings) {
  return std::make_shared<HashEmbeddingProvider>(static_cast<size_t>(settings.hash_dimension));
}

std::shared_ptr<TextGenerator> ProviderFactory::create_text_generator(const Settings& settings) {
  switch (settings.generation_backend) {
    case GenerationBackend::Remote:
      return std::make_shared<RemoteTextGenerator>(make_api_client(settings, http_client(), sleeper()),
                                                   settings.remote_generation_model);
    case GenerationBackend::Ollama:
    default:
      return std::make_shared<OllamaTextGenerator>(settings.ollama_url, settings.generation_model);
  }
}

std::shared_ptr<HttpClient> ProviderFactory::http_client() {
  return http_client_;
}

}  // namespace margin_core
