#include "margin_core/retrieval/retrieval_orchestrator.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <unordered_map>
#include <utility>

#include "margin_core/retrieval/context_builder.hpp"
#include "margin_core/retrieval/sub_query_planner.hpp"
#include "margin_core/util/text.hpp"

namespace margin_core {

RefinementOptions RefinementOptions::from_settings(const Settings& settings) {
  return RefinementOptions{
      .max_iterations = settings.max_refinement_iterations,
      .context_window = static_cast<size_t>(settings.context_window),
      .expanded_context_window = static_cast<size_t>(settings.expanded_context_window),
      .min_context_chars = static_cast<size_t>(settings.min_context_chars),
  };
}

RetrievalOrchestrator::RetrievalOrchestrator(std::shared_ptr<SettingsStore> settings,
                                             std::shared_ptr<TieredEmbedder> embedder,
                                             std::shared_ptr<VectorStore> vector_store,
                                             std::shared_ptr<ProviderFactory> providers,
                                             std::shared_ptr<MetadataStore> metadata_store,
                                             std::shared_ptr<SufficiencyJudge> judge)
    : settings_(std::move(settings)),
      embedder_(std::move(embedder)),
      vector_store_(std::move(vector_store)),
      providers_(std::move(providers)),
      metadata_store_(std::move(metadata_store)),
      judge_(std::move(judge)) {
  if (!judge_) {
    judge_ = std::make_shared<LlmSufficiencyJudge>(providers_);
  }
}

RagResult RetrievalOrchestrator::query(const std::string& notebook_id,
                                       const std::string& question,
                                       const std::optional<std::vector<std::string>>& source_ids,
                                       const TitleMap& title_map,
                                       const QueryOptions& options) {
  const Settings settings = settings_->current();
  try {
    const TitleMap titles = resolve_titles(notebook_id, title_map);
    if (options.agentic) {
      return agentic_query(notebook_id, question, source_ids, titles, settings);
    }
    return standard_query(notebook_id, question, source_ids, titles, settings);
  } catch (const RetrievalError&) {
    throw;
  } catch (const std::exception& e) {
    throw RetrievalError("Retrieval failed: " + std::string(e.what()));
  }
}

RagResult RetrievalOrchestrator::query_or_empty(const std::string& notebook_id,
                                                const std::string& question,
                                                const std::optional<std::vector<std::string>>& source_ids,
                                                const TitleMap& title_map,
                                                const QueryOptions& options) {
  try {
    return query(notebook_id, question, source_ids, title_map, options);
  } catch (const RetrievalError& e) {
    std::cerr << "[Retrieval] " << e.what() << std::endl;
    return {};
  }
}

RagResult RetrievalOrchestrator::standard_query(const std::string& notebook_id,
                                                const std::string& question,
                                                const std::optional<std::vector<std::string>>& source_ids,
                                                const TitleMap& titles,
                                                const Settings& settings) {
  std::vector<SearchHit> hits =
      search_one(notebook_id, question, source_ids, static_cast<size_t>(settings.standard_limit));
  return {format_context(hits, hits.size(), titles), build_citations(hits, hits.size(), titles)};
}

RagResult RetrievalOrchestrator::agentic_query(const std::string& notebook_id,
                                               const std::string& question,
                                               const std::optional<std::vector<std::string>>& source_ids,
                                               const TitleMap& titles,
                                               const Settings& settings) {
  auto generator = providers_->text_generator();
  const std::vector<std::string> sub_queries = SubQueryPlanner::plan(generator.get(), question);

  std::vector<SearchHit> merged =
      multi_query_search(notebook_id, sub_queries, source_ids, static_cast<size_t>(settings.subquery_limit));
  if (merged.empty()) {
    return {};
  }

  const RefinementOptions refinement = RefinementOptions::from_settings(settings);
  const size_t step = refinement.expanded_context_window > refinement.context_window
                          ? refinement.expanded_context_window - refinement.context_window
                          : 0;

  size_t window = refinement.context_window;
  std::string context = format_context(merged, window, titles);

  for (int iteration = 0; iteration < refinement.max_iterations && step > 0; ++iteration) {
    if (merged.size() <= window) {
      break;
    }
    if (!needs_more_context(question, context, refinement)) {
      break;
    }
    window += step;
    context = format_context(merged, window, titles);
  }

  return {std::move(context), build_citations(merged, refinement.context_window, titles)};
}

std::vector<SearchHit> RetrievalOrchestrator::search_one(const std::string& notebook_id,
                                                         const std::string& query,
                                                         const std::optional<std::vector<std::string>>& source_ids,
                                                         size_t limit) {
  EmbeddingResult embedding = embedder_->embed_query_tagged(query);
  return vector_store_->search(notebook_id, embedding.vectors.front(), limit, source_ids, embedding.tag());
}

std::vector<SearchHit> RetrievalOrchestrator::multi_query_search(
    const std::string& notebook_id,
    const std::vector<std::string>& queries,
    const std::optional<std::vector<std::string>>& source_ids,
    size_t limit) {
  std::vector<std::future<std::vector<SearchHit>>> pending;
  pending.reserve(queries.size());
  for (const auto& query : queries) {
    pending.push_back(std::async(std::launch::async, [this, &notebook_id, query, &source_ids, limit]() {
      return search_one(notebook_id, query, source_ids, limit);
    }));
  }

  std::vector<std::vector<SearchHit>> per_query;
  std::string first_error;
  for (auto& future : pending) {
    try {
      per_query.push_back(future.get());
    } catch (const std::exception& e) {
      std::cerr << "[Retrieval] Sub-query failed: " << e.what() << std::endl;
      if (first_error.empty()) {
        first_error = e.what();
      }
    }
  }

  if (per_query.empty() && !queries.empty()) {
    throw RetrievalError("All sub-queries failed: " + first_error);
  }
  return merge_results(per_query);
}

std::vector<SearchHit> RetrievalOrchestrator::merge_results(
    const std::vector<std::vector<SearchHit>>& per_query) {
  std::unordered_map<std::string, SearchHit> best;
  for (const auto& hits : per_query) {
    for (const auto& hit : hits) {
      auto it = best.find(hit.id);
      if (it == best.end()) {
        best.emplace(hit.id, hit);
      } else if (hit.score > it->second.score) {
        it->second = hit;
      }
    }
  }

  std::vector<SearchHit> merged;
  merged.reserve(best.size());
  for (auto& entry : best) {
    merged.push_back(std::move(entry.second));
  }
  std::sort(merged.begin(), merged.end(), [](const SearchHit& a, const SearchHit& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.id < b.id;
  });
  return merged;
}

bool RetrievalOrchestrator::needs_more_context(const std::string& question,
                                               const std::string& context,
                                               const RefinementOptions& refinement) {
  if (text::char_length(text::sanitize_utf8(context)) < refinement.min_context_chars) {
    return true;
  }
  try {
    return !judge_->is_sufficient(question, context);
  } catch (const std::exception& e) {
    std::cerr << "[Retrieval] Sufficiency check failed, keeping current context: " << e.what()
              << std::endl;
    return false;
  }
}

TitleMap RetrievalOrchestrator::resolve_titles(const std::string& notebook_id, const TitleMap& title_map) {
  if (!title_map.empty() || !metadata_store_) {
    return title_map;
  }
  try {
    return metadata_store_->source_titles(notebook_id);
  } catch (const MetadataStoreError& e) {
    std::cerr << "[Retrieval] Warning: could not load source titles: " << e.what() << std::endl;
    return title_map;
  }
}

}  // namespace margin_core
