#pragma once

#include <memory>
#include <string>
#include <vector>

#include "margin_core/config/settings_store.hpp"
#include "margin_core/db/metadata_store.hpp"
#include "margin_core/embeddings/tiered_embedder.hpp"
#include "margin_core/storage/vector_store.hpp"

namespace margin_core {

// Finds sources in other notebooks that resemble a given source.
class RecommendationService {
 public:
  static constexpr size_t DEFAULT_LIMIT = 5;

  RecommendationService(std::shared_ptr<SettingsStore> settings,
                        std::shared_ptr<MetadataStore> metadata_store,
                        std::shared_ptr<TieredEmbedder> embedder,
                        std::shared_ptr<VectorStore> vector_store);

  // Empty when the source is unknown or blank, or no other notebook exists.
  std::vector<SourceRecommendation> find_related_sources(const std::string& notebook_id,
                                                         const std::string& source_id,
                                                         size_t limit = DEFAULT_LIMIT);

  // Keeps the highest-scoring hit per source_id, best first, at most limit.
  static std::vector<SearchHit> best_hit_per_source(const std::vector<SearchHit>& hits, size_t limit);

 private:
  std::shared_ptr<SettingsStore> settings_;
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<TieredEmbedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
};

}  // namespace margin_core
