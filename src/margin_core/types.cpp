#include "margin_core/types.hpp"

#include <stdexcept>

namespace margin_core {

std::string to_string(EmbeddingTier tier) {
  switch (tier) {
    case EmbeddingTier::Local:
      return "local";
    case EmbeddingTier::Remote:
      return "remote";
    case EmbeddingTier::Hash:
      return "hash";
    default:
      return "unknown";
  }
}

EmbeddingTier embedding_tier_from_string(const std::string& str) {
  if (str == "local")
    return EmbeddingTier::Local;
  if (str == "remote")
    return EmbeddingTier::Remote;
  if (str == "hash")
    return EmbeddingTier::Hash;
  throw std::invalid_argument("Unknown EmbeddingTier: " + str);
}

}  // namespace margin_core
