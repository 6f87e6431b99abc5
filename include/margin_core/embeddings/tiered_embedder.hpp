#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "margin_core/config/settings_store.hpp"
#include "margin_core/embeddings/provider_factory.hpp"
#include "margin_core/types/embedding.hpp"

namespace margin_core {

/**
 * @brief Produces embeddings through the local -> remote -> hash chain.
 *
 * In auto mode each tier is tried in order and the first success wins; the
 * hash tier cannot fail, so embedding never fails outright. Local mode falls
 * back to the same chain when the on-device model is missing or errors.
 * Remote mode throws ConfigurationError without an API key and falls back to
 * hash on any other remote failure.
 *
 * Every result is tagged with the tier that produced it.
 */
class TieredEmbedder {
 public:
  TieredEmbedder(std::shared_ptr<SettingsStore> settings, std::shared_ptr<ProviderFactory> providers);
  virtual ~TieredEmbedder() = default;

  virtual EmbeddingResult embed_tagged(const std::vector<std::string>& texts);

  std::vector<Embedding> embed(const std::vector<std::string>& texts);
  Embedding embed_query(const std::string& text);
  EmbeddingResult embed_query_tagged(const std::string& text);

  // The tier the next call would try first, without embedding anything.
  virtual EmbeddingTier get_active_model();

 private:
  EmbeddingResult embed_with_chain(const std::vector<std::string>& texts, bool skip_local);
  std::optional<EmbeddingResult> try_provider(EmbeddingProvider& provider,
                                              const std::vector<std::string>& texts,
                                              bool propagate_configuration_errors);
  EmbeddingResult embed_with_hash(const std::vector<std::string>& texts);

  std::shared_ptr<SettingsStore> settings_;
  std::shared_ptr<ProviderFactory> providers_;
};

}  // namespace margin_core
