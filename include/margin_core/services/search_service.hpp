#pragma once

#include <memory>
#include <string>
#include <vector>

#include "margin_core/db/metadata_store.hpp"
#include "margin_core/embeddings/tiered_embedder.hpp"
#include "margin_core/storage/vector_store.hpp"

namespace margin_core {

class SearchServiceException : public std::exception {
 public:
  explicit SearchServiceException(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class SearchService {
 public:
  static constexpr size_t DEFAULT_LIMIT = 10;
  static constexpr size_t SNIPPET_CHARS = 300;

  SearchService(std::shared_ptr<MetadataStore> metadata_store,
                std::shared_ptr<TieredEmbedder> embedder,
                std::shared_ptr<VectorStore> vector_store);

  // Semantic search across notebooks. An empty notebook list searches every
  // notebook in the catalog. Result text is cut to SNIPPET_CHARS characters.
  std::vector<GlobalSearchResult> search_global(const std::string& query,
                                                const std::vector<std::string>& notebook_ids = {},
                                                size_t limit = DEFAULT_LIMIT);

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<TieredEmbedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
};

}  // namespace margin_core
