#pragma once

#include "margin_core/embeddings/embedding_provider.hpp"

namespace margin_core {

// Deterministic, dependency-free fallback. Each code point adds
// (code point / 256) to bucket (position mod dimension); the result is
// L2-normalized. Captures character distribution only, not meaning.
class HashEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 768;

  explicit HashEmbeddingProvider(size_t dimension = DEFAULT_DIMENSION);

  EmbeddingTier tier() const override {
    return EmbeddingTier::Hash;
  }
  bool is_available() override {
    return true;
  }
  std::vector<Embedding> embed(const std::vector<std::string>& texts) override;

  Embedding embed_text(const std::string& text) const;
  size_t dimension() const {
    return dimension_;
  }

 private:
  size_t dimension_;
};

}  // namespace margin_core
