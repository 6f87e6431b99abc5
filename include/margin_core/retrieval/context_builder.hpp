#pragma once

#include <string>
#include <vector>

#include "margin_core/types/retrieval.hpp"

namespace margin_core {

constexpr size_t CITATION_SNIPPET_CHARS = 200;

// Title used when a source id is missing from the title map.
inline const char* const DEFAULT_SOURCE_TITLE = "Source";

// Formats the first `count` hits as numbered blocks separated by blank lines:
//   [Source 1: Title p.3]
//   chunk text
std::string format_context(const std::vector<SearchHit>& hits, size_t count, const TitleMap& titles);

// One citation per hit, over the first `count` hits, with the text cut to
// CITATION_SNIPPET_CHARS characters.
std::vector<Citation> build_citations(const std::vector<SearchHit>& hits,
                                      size_t count,
                                      const TitleMap& titles);

}  // namespace margin_core
