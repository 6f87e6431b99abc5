#include "margin_core/services/search_service.hpp"

#include <utility>

#include "margin_core/util/text.hpp"

namespace margin_core {

SearchService::SearchService(std::shared_ptr<MetadataStore> metadata_store,
                             std::shared_ptr<TieredEmbedder> embedder,
                             std::shared_ptr<VectorStore> vector_store)
    : metadata_store_(std::move(metadata_store)),
      embedder_(std::move(embedder)),
      vector_store_(std::move(vector_store)) {}

std::vector<GlobalSearchResult> SearchService::search_global(const std::string& query,
                                                             const std::vector<std::string>& notebook_ids,
                                                             size_t limit) {
  if (text::is_blank(query) || limit == 0) {
    return {};
  }

  try {
    std::vector<std::string> targets = notebook_ids;
    if (targets.empty()) {
      for (const auto& notebook : metadata_store_->list_notebooks()) {
        targets.push_back(notebook.id);
      }
    }
    if (targets.empty()) {
      return {};
    }

    EmbeddingResult embedding = embedder_->embed_query_tagged(query);
    std::vector<SearchHit> hits =
        vector_store_->search_multiple(targets, embedding.vectors.front(), limit, embedding.tag());

    const TitleMap notebook_titles = metadata_store_->notebook_titles();
    const TitleMap source_titles = metadata_store_->all_source_titles();

    std::vector<GlobalSearchResult> results;
    results.reserve(hits.size());
    for (auto& hit : hits) {
      GlobalSearchResult result;
      result.notebook_id = hit.notebook_id;
      auto nb = notebook_titles.find(hit.notebook_id);
      result.notebook_title = nb == notebook_titles.end() ? "Unknown Notebook" : nb->second;
      result.source_id = hit.source_id;
      auto src = source_titles.find(hit.source_id);
      result.source_title = src == source_titles.end() ? "Unknown Source" : src->second;
      result.text = text::truncate_chars(text::sanitize_utf8(hit.text), SNIPPET_CHARS);
      result.score = hit.score;
      result.page_number = hit.page_number;
      results.push_back(std::move(result));
    }
    return results;
  } catch (const std::exception& e) {
    throw SearchServiceException("Search failed: " + std::string(e.what()));
  }
}

}  // namespace margin_core
