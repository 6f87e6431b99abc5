#include "margin_core/retrieval/context_builder.hpp"

#include <algorithm>

#include "margin_core/util/text.hpp"

namespace margin_core {

namespace {

std::string title_for(const std::string& source_id, const TitleMap& titles) {
  auto it = titles.find(source_id);
  return it == titles.end() ? DEFAULT_SOURCE_TITLE : it->second;
}

}  // namespace

std::string format_context(const std::vector<SearchHit>& hits, size_t count, const TitleMap& titles) {
  const size_t n = std::min(count, hits.size());
  std::string context;
  for (size_t i = 0; i < n; ++i) {
    const SearchHit& hit = hits[i];
    if (i > 0) {
      context += "\n\n";
    }
    context += "[Source " + std::to_string(i + 1) + ": " + title_for(hit.source_id, titles);
    if (hit.page_number) {
      context += " p." + std::to_string(*hit.page_number);
    }
    context += "]\n";
    context += hit.text;
  }
  return context;
}

std::vector<Citation> build_citations(const std::vector<SearchHit>& hits,
                                      size_t count,
                                      const TitleMap& titles) {
  const size_t n = std::min(count, hits.size());
  std::vector<Citation> citations;
  citations.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const SearchHit& hit = hits[i];
    citations.push_back({hit.source_id, title_for(hit.source_id, titles),
                         text::truncate_chars(text::sanitize_utf8(hit.text), CITATION_SNIPPET_CHARS),
                         hit.page_number});
  }
  return citations;
}

}  // namespace margin_core
