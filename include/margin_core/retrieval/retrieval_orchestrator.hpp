#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "margin_core/config/settings_store.hpp"
#include "margin_core/db/metadata_store.hpp"
#include "margin_core/embeddings/provider_factory.hpp"
#include "margin_core/embeddings/tiered_embedder.hpp"
#include "margin_core/retrieval/sufficiency_judge.hpp"
#include "margin_core/storage/vector_store.hpp"
#include "margin_core/types/retrieval.hpp"

namespace margin_core {

class RetrievalError : public std::exception {
 public:
  explicit RetrievalError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct QueryOptions {
  bool agentic = true;
};

struct RefinementOptions {
  int max_iterations = 1;
  size_t context_window = 8;
  size_t expanded_context_window = 12;
  size_t min_context_chars = 200;

  static RefinementOptions from_settings(const Settings& settings);
};

/**
 * @brief Turns a question into grounded context and citations.
 *
 * Standard mode runs one similarity search. Agentic mode plans up to three
 * sub-queries, searches them concurrently, merges hits by chunk id keeping the
 * best score, and may widen the context window once the sufficiency judge
 * reports the top results as insufficient. Citations always cover the top
 * context_window hits.
 *
 * Text generation failures never fail a query; embedding or search failures
 * surface as RetrievalError.
 */
class RetrievalOrchestrator {
 public:
  // metadata_store and judge may be null. Without a judge an
  // LlmSufficiencyJudge over the provider factory is used.
  RetrievalOrchestrator(std::shared_ptr<SettingsStore> settings,
                        std::shared_ptr<TieredEmbedder> embedder,
                        std::shared_ptr<VectorStore> vector_store,
                        std::shared_ptr<ProviderFactory> providers,
                        std::shared_ptr<MetadataStore> metadata_store = nullptr,
                        std::shared_ptr<SufficiencyJudge> judge = nullptr);

  // When title_map is empty, titles are looked up in the metadata store.
  RagResult query(const std::string& notebook_id,
                  const std::string& question,
                  const std::optional<std::vector<std::string>>& source_ids = std::nullopt,
                  const TitleMap& title_map = {},
                  const QueryOptions& options = {});

  // Same as query(), but logs failures and returns an empty result.
  RagResult query_or_empty(const std::string& notebook_id,
                           const std::string& question,
                           const std::optional<std::vector<std::string>>& source_ids = std::nullopt,
                           const TitleMap& title_map = {},
                           const QueryOptions& options = {});

  // Max score per chunk id, sorted by score descending then id ascending.
  static std::vector<SearchHit> merge_results(const std::vector<std::vector<SearchHit>>& per_query);

 private:
  RagResult standard_query(const std::string& notebook_id,
                           const std::string& question,
                           const std::optional<std::vector<std::string>>& source_ids,
                           const TitleMap& titles,
                           const Settings& settings);

  RagResult agentic_query(const std::string& notebook_id,
                          const std::string& question,
                          const std::optional<std::vector<std::string>>& source_ids,
                          const TitleMap& titles,
                          const Settings& settings);

  std::vector<SearchHit> multi_query_search(const std::string& notebook_id,
                                            const std::vector<std::string>& queries,
                                            const std::optional<std::vector<std::string>>& source_ids,
                                            size_t limit);

  std::vector<SearchHit> search_one(const std::string& notebook_id,
                                    const std::string& query,
                                    const std::optional<std::vector<std::string>>& source_ids,
                                    size_t limit);

  bool needs_more_context(const std::string& question,
                          const std::string& context,
                          const RefinementOptions& refinement);

  TitleMap resolve_titles(const std::string& notebook_id, const TitleMap& title_map);

  std::shared_ptr<SettingsStore> settings_;
  std::shared_ptr<TieredEmbedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<ProviderFactory> providers_;
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<SufficiencyJudge> judge_;
};

}  // namespace margin_core
