#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. margin_core/types/chunk.hpp),
// users can simply do `#include "margin_core/types.hpp"`.
//
#include "margin_core/types/chunk.hpp"
#include "margin_core/types/embedding.hpp"
#include "margin_core/types/retrieval.hpp"
