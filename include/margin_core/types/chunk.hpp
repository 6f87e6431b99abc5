#pragma once

#include <optional>
#include <string>

namespace margin_core {

// A bounded passage of a source document. chunk_index is strictly increasing
// within a source and follows document order.
struct Chunk {
  std::string id;
  std::string source_id;
  std::string text;
  int chunk_index = 0;
  int token_count_estimate = 0;
  std::optional<int> page_number;
};

}  // namespace margin_core
