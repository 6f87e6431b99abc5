#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace margin_core {

// source_id -> human readable title
using TitleMap = std::unordered_map<std::string, std::string>;

struct SearchHit {
  std::string id;
  std::string notebook_id;
  std::string source_id;
  std::string text;
  float score = 0.0f;
  int chunk_index = 0;
  std::optional<int> page_number;
};

struct Citation {
  std::string source_id;
  std::string source_title;
  std::string chunk_text;
  std::optional<int> page_number;
};

struct RagResult {
  std::string context;
  std::vector<Citation> citations;
};

struct SourceRecommendation {
  std::string notebook_id;
  std::string notebook_title;
  std::string source_id;
  std::string source_title;
  float score = 0.0f;
};

struct GlobalSearchResult {
  std::string notebook_id;
  std::string notebook_title;
  std::string source_id;
  std::string source_title;
  std::string text;
  float score = 0.0f;
  std::optional<int> page_number;
};

}  // namespace margin_core
