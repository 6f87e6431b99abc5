#include "margin_core/embeddings/tiered_embedder.hpp"

#include <iostream>
#include <utility>

namespace margin_core {

TieredEmbedder::TieredEmbedder(std::shared_ptr<SettingsStore> settings,
                               std::shared_ptr<ProviderFactory> providers)
    : settings_(std::move(settings)), providers_(std::move(providers)) {}

EmbeddingResult TieredEmbedder::embed_tagged(const std::vector<std::string>& texts) {
  if (texts.empty()) {
    return {get_active_model(), {}};
  }

  const Settings settings = settings_->current();
  switch (settings.embedding_mode) {
    case EmbeddingMode::Local: {
      auto local = providers_->local_provider();
      if (local->is_available()) {
        if (auto result = try_provider(*local, texts, false)) {
          return *result;
        }
      } else {
        std::cerr << "[TieredEmbedder] Local model unavailable, falling back" << std::endl;
      }
      return embed_with_chain(texts, true);
    }
    case EmbeddingMode::Remote: {
      auto remote = providers_->remote_provider();
      if (!remote->is_available()) {
        throw ConfigurationError("Remote embedding mode requires an API key");
      }
      if (auto result = try_provider(*remote, texts, true)) {
        return *result;
      }
      return embed_with_hash(texts);
    }
    case EmbeddingMode::Auto:
    default:
      return embed_with_chain(texts, false);
  }
}

std::vector<Embedding> TieredEmbedder::embed(const std::vector<std::string>& texts) {
  return embed_tagged(texts).vectors;
}

Embedding TieredEmbedder::embed_query(const std::string& text) {
  return embed_query_tagged(text).vectors.front();
}

EmbeddingResult TieredEmbedder::embed_query_tagged(const std::string& text) {
  EmbeddingResult result = embed_tagged({text});
  if (result.vectors.size() != 1) {
    return embed_with_hash({text});
  }
  return result;
}

EmbeddingTier TieredEmbedder::get_active_model() {
  const Settings settings = settings_->current();
  if (settings.embedding_mode == EmbeddingMode::Remote) {
    return EmbeddingTier::Remote;
  }
  if (providers_->local_provider()->is_available()) {
    return EmbeddingTier::Local;
  }
  if (providers_->remote_provider()->is_available()) {
    return EmbeddingTier::Remote;
  }
  return EmbeddingTier::Hash;
}

EmbeddingResult TieredEmbedder::embed_with_chain(const std::vector<std::string>& texts, bool skip_local) {
  std::vector<std::shared_ptr<EmbeddingProvider>> chain;
  if (!skip_local) {
    chain.push_back(providers_->local_provider());
  }
  chain.push_back(providers_->remote_provider());

  for (const auto& provider : chain) {
    if (!provider->is_available()) {
      continue;
    }
    if (auto result = try_provider(*provider, texts, false)) {
      return *result;
    }
  }
  return embed_with_hash(texts);
}

std::optional<EmbeddingResult> TieredEmbedder::try_provider(EmbeddingProvider& provider,
                                                            const std::vector<std::string>& texts,
                                                            bool propagate_configuration_errors) {
  const std::string tier_name = to_string(provider.tier());
  try {
    std::vector<Embedding> vectors = provider.embed(texts);
    if (vectors.size() != texts.size()) {
      std::cerr << "[TieredEmbedder] " << tier_name << " tier returned " << vectors.size()
                << " vectors for " << texts.size() << " texts" << std::endl;
      return std::nullopt;
    }
    for (const auto& vector : vectors) {
      if (vector.empty() || vector.size() != vectors.front().size()) {
        std::cerr << "[TieredEmbedder] " << tier_name << " tier returned inconsistent vectors"
                  << std::endl;
        return std::nullopt;
      }
    }
    return EmbeddingResult{provider.tier(), std::move(vectors)};
  } catch (const ConfigurationError&) {
    if (propagate_configuration_errors) {
      throw;
    }
    std::cerr << "[TieredEmbedder] " << tier_name << " tier is not configured, falling back" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[TieredEmbedder] " << tier_name << " tier failed, falling back: " << e.what()
              << std::endl;
  }
  return std::nullopt;
}

EmbeddingResult TieredEmbedder::embed_with_hash(const std::vector<std::string>& texts) {
  auto hash = providers_->hash_provider();
  return {EmbeddingTier::Hash, hash->embed(texts)};
}

}  // namespace margin_core
