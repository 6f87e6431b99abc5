#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace margin_core {

using Embedding = std::vector<float>;

// Embedding provider strategy that produced a vector. Vectors from different
// tiers are not comparable.
enum class EmbeddingTier { Local, Remote, Hash };

std::string to_string(EmbeddingTier tier);
EmbeddingTier embedding_tier_from_string(const std::string& str);

struct EmbeddingTag {
  EmbeddingTier tier = EmbeddingTier::Hash;
  size_t dimension = 0;

  bool operator==(const EmbeddingTag&) const = default;
};

struct EmbeddingResult {
  EmbeddingTier tier = EmbeddingTier::Hash;
  std::vector<Embedding> vectors;

  EmbeddingTag tag() const {
    return {tier, vectors.empty() ? 0 : vectors.front().size()};
  }
};

}  // namespace margin_core
