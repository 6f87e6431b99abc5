#include "margin_core/storage/similarity.hpp"

#include <faiss/utils/distances.h>

#include <cmath>

namespace margin_core {

float cosine_similarity(const Embedding& a, const Embedding& b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0f;
  }
  const size_t d = a.size();
  const float dot = faiss::fvec_inner_product(a.data(), b.data(), d);
  const float norm_a = faiss::fvec_norm_L2sqr(a.data(), d);
  const float norm_b = faiss::fvec_norm_L2sqr(b.data(), d);
  const float denominator = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denominator == 0.0f) {
    return 0.0f;
  }
  return dot / denominator;
}

}  // namespace margin_core
