#include "margin_core/embeddings/hash_embedding_provider.hpp"

#include <utf8.h>

#include <cmath>
#include <cstdint>

#include "margin_core/util/text.hpp"

namespace margin_core {

HashEmbeddingProvider::HashEmbeddingProvider(size_t dimension)
    : dimension_(dimension == 0 ? DEFAULT_DIMENSION : dimension) {}

std::vector<Embedding> HashEmbeddingProvider::embed(const std::vector<std::string>& texts) {
  std::vector<Embedding> vectors;
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(embed_text(text));
  }
  return vectors;
}

Embedding HashEmbeddingProvider::embed_text(const std::string& text) const {
  std::vector<double> buckets(dimension_, 0.0);
  const std::string clean = text::sanitize_utf8(text);

  size_t position = 0;
  for (auto it = clean.begin(); it != clean.end(); ++position) {
    uint32_t code_point = utf8::next(it, clean.end());
    buckets[position % dimension_] += static_cast<double>(code_point) / 256.0;
  }

  double norm = 0.0;
  for (double value : buckets) {
    norm += value * value;
  }
  norm = std::sqrt(norm);

  Embedding vector(dimension_, 0.0f);
  if (norm == 0.0) {
    return vector;
  }
  for (size_t i = 0; i < dimension_; ++i) {
    vector[i] = static_cast<float>(buckets[i] / norm);
  }
  return vector;
}

}  // namespace margin_core
