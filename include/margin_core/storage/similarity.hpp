#pragma once

#include "margin_core/types/embedding.hpp"

namespace margin_core {

// Cosine similarity in [-1, 1]. Returns 0 when either vector has zero norm or
// the dimensions differ.
float cosine_similarity(const Embedding& a, const Embedding& b);

}  // namespace margin_core
