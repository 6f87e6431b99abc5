#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "margin_core/config/settings_store.hpp"
#include "margin_core/embeddings/embedding_provider.hpp"
#include "margin_core/llm/text_generator.hpp"
#include "margin_core/net/http_client.hpp"
#include "margin_core/net/retry.hpp"

namespace margin_core {

/**
 * @brief Builds and caches provider clients for the current settings.
 *
 * Clients are created lazily and reused until the SettingsStore version
 * changes, at which point every cached client is dropped and rebuilt on next
 * use. Callers that still hold an old client keep it alive until they finish.
 */
class ProviderFactory {
 public:
  explicit ProviderFactory(std::shared_ptr<SettingsStore> settings);
  virtual ~ProviderFactory() = default;

  ProviderFactory(const ProviderFactory&) = delete;
  ProviderFactory& operator=(const ProviderFactory&) = delete;

  std::shared_ptr<EmbeddingProvider> local_provider();
  std::shared_ptr<EmbeddingProvider> remote_provider();
  std::shared_ptr<EmbeddingProvider> hash_provider();

  // May return nullptr when no generation backend can be built.
  std::shared_ptr<TextGenerator> text_generator();

  std::shared_ptr<SettingsStore> settings() const {
    return settings_;
  }

 protected:
  virtual std::shared_ptr<EmbeddingProvider> create_local_provider(const Settings& settings);
  virtual std::shared_ptr<EmbeddingProvider> create_remote_provider(const Settings& settings);
  virtual std::shared_ptr<EmbeddingProvider> create_hash_provider(const Settings& settings);
  virtual std::shared_ptr<TextGenerator> create_text_generator(const Settings& settings);

  virtual std::shared_ptr<HttpClient> http_client();
  virtual Sleeper sleeper() {
    return sleep_for;
  }

 private:
  struct CachedClients {
    std::shared_ptr<EmbeddingProvider> local;
    std::shared_ptr<EmbeddingProvider> remote;
    std::shared_ptr<EmbeddingProvider> hash;
    std::shared_ptr<TextGenerator> generator;
  };

  // Must be called with mutex_ held. Returns the settings the cache was built for.
  Settings refresh_locked();

  std::shared_ptr<SettingsStore> settings_;
  std::mutex mutex_;
  std::uint64_t cached_version_ = 0;
  CachedClients clients_;
  std::shared_ptr<HttpClient> http_client_;
};

}  // namespace margin_core
