#pragma once

#include <optional>
#include <string>
#include <vector>

#include "margin_core/types/embedding.hpp"

namespace margin_core {

struct ShardEntry {
  std::string id;
  std::string source_id;
  std::string text;
  Embedding vector;
  int chunk_index = 0;
  std::optional<int> page_number;
};

// All vectors of one source within one notebook. The embedding tag is absent
// for shards written without tier information.
struct VectorShard {
  std::string source_id;
  std::optional<EmbeddingTag> embedding;
  std::vector<ShardEntry> entries;
};

}  // namespace margin_core
