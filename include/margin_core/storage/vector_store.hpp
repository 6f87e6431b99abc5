#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "margin_core/storage/shard_store.hpp"
#include "margin_core/types/chunk.hpp"
#include "margin_core/types/embedding.hpp"
#include "margin_core/types/retrieval.hpp"

namespace margin_core {

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Sharded vector index with exact cosine search.
 *
 * Each (notebook, source) pair owns one shard; adding documents replaces the
 * shard wholesale. Search scans every shard of the requested notebooks.
 * Shards that cannot be decoded are skipped with a warning. Entries whose
 * dimension differs from the query, and shards tagged with a different tier
 * than the query, are never compared.
 */
class VectorStore {
 public:
  explicit VectorStore(std::shared_ptr<ShardStore> shard_store);
  virtual ~VectorStore() = default;

  VectorStore(const VectorStore&) = delete;
  VectorStore& operator=(const VectorStore&) = delete;

  // Throws VectorStoreError when chunks and vectors differ in length.
  // Chunks paired with an empty vector are not stored.
  void add_documents(const std::string& notebook_id,
                     const std::string& source_id,
                     const std::vector<Chunk>& chunks,
                     const std::vector<Embedding>& vectors,
                     const std::optional<EmbeddingTag>& tag = std::nullopt);

  virtual std::vector<SearchHit> search(const std::string& notebook_id,
                                        const Embedding& query_vector,
                                        size_t limit,
                                        const std::optional<std::vector<std::string>>& source_filter = std::nullopt,
                                        const std::optional<EmbeddingTag>& query_tag = std::nullopt);

  virtual std::vector<SearchHit> search_multiple(const std::vector<std::string>& notebook_ids,
                                                 const Embedding& query_vector,
                                                 size_t limit,
                                                 const std::optional<EmbeddingTag>& query_tag = std::nullopt);

  void delete_source(const std::string& notebook_id, const std::string& source_id);
  void delete_notebook(const std::string& notebook_id);

  bool has_source(const std::string& notebook_id, const std::string& source_id);
  std::vector<std::string> list_sources(const std::string& notebook_id);
  std::vector<std::string> list_notebooks();

  // Tag the source's shard was written with; nullopt when missing or untagged.
  std::optional<EmbeddingTag> source_tag(const std::string& notebook_id, const std::string& source_id);

 private:
  void scan_notebook(const std::string& notebook_id,
                     const Embedding& query_vector,
                     const std::optional<EmbeddingTag>& query_tag,
                     const std::unordered_set<std::string>* source_filter,
                     std::vector<SearchHit>& hits);

  // Descending by score, ties in scan order; truncated to limit.
  static void rank(std::vector<SearchHit>& hits, size_t limit);

  std::shared_ptr<ShardStore> shard_store_;
};

}  // namespace margin_core
