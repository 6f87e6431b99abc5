#include "margin_core/services/recommendation_service.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "margin_core/util/text.hpp"

namespace margin_core {

RecommendationService::RecommendationService(std::shared_ptr<SettingsStore> settings,
                                             std::shared_ptr<MetadataStore> metadata_store,
                                             std::shared_ptr<TieredEmbedder> embedder,
                                             std::shared_ptr<VectorStore> vector_store)
    : settings_(std::move(settings)),
      metadata_store_(std::move(metadata_store)),
      embedder_(std::move(embedder)),
      vector_store_(std::move(vector_store)) {}

std::vector<SearchHit> RecommendationService::best_hit_per_source(const std::vector<SearchHit>& hits,
                                                                  size_t limit) {
  std::unordered_map<std::string, size_t> index_by_source;
  std::vector<SearchHit> best;
  for (const auto& hit : hits) {
    auto it = index_by_source.find(hit.source_id);
    if (it == index_by_source.end()) {
      index_by_source.emplace(hit.source_id, best.size());
      best.push_back(hit);
    } else if (hit.score > best[it->second].score) {
      best[it->second] = hit;
    }
  }
  std::stable_sort(best.begin(), best.end(),
                   [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });
  if (best.size() > limit) {
    best.resize(limit);
  }
  return best;
}

std::vector<SourceRecommendation> RecommendationService::find_related_sources(const std::string& notebook_id,
                                                                            const std::string& source_id,
                                                                            size_t limit) {
  if (limit == 0) {
    return {};
  }

  auto source = metadata_store_->get_source(source_id);
  if (!source || text::is_blank(source->content)) {
    return {};
  }

  std::vector<std::string> other_notebooks;
  for (const auto& notebook : metadata_store_->list_notebooks()) {
    if (notebook.id != notebook_id) {
      other_notebooks.push_back(notebook.id);
    }
  }
  if (other_notebooks.empty()) {
    return {};
  }

  const Settings settings = settings_->current();
  const std::string sample = text::truncate_chars(text::sanitize_utf8(source->content),
                                                  static_cast<size_t>(settings.recommendation_sample_chars));
  EmbeddingResult embedding = embedder_->embed_query_tagged(sample);

  const size_t overfetch = limit * static_cast<size_t>(settings.recommendation_overfetch);
  std::vector<SearchHit> hits =
      vector_store_->search_multiple(other_notebooks, embedding.vectors.front(), overfetch, embedding.tag());

  const TitleMap notebook_titles = metadata_store_->notebook_titles();
  const TitleMap source_titles = metadata_store_->all_source_titles();

  std::vector<SourceRecommendation> recommendations;
  for (const auto& hit : best_hit_per_source(hits, limit)) {
    SourceRecommendation rec;
    rec.notebook_id = hit.notebook_id;
    auto nb = notebook_titles.find(hit.notebook_id);
    rec.notebook_title = nb == notebook_titles.end() ? "Unknown Notebook" : nb->second;
    rec.source_id = hit.source_id;
    auto src = source_titles.find(hit.source_id);
    rec.source_title = src == source_titles.end() ? "Unknown Source" : src->second;
    rec.score = hit.score;
    recommendations.push_back(std::move(rec));
  }
  return recommendations;
}

}  // namespace margin_core
