#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "margin_core/chunking/chunker.hpp"
#include "margin_core/config/settings_store.hpp"
#include "margin_core/db/metadata_store.hpp"
#include "margin_core/embeddings/tiered_embedder.hpp"
#include "margin_core/storage/vector_store.hpp"

namespace margin_core {

class IngestionError : public std::exception {
 public:
  explicit IngestionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IngestRequest {
  std::string notebook_id;
  std::string source_id;
  std::string title;
  std::string text;
  // Byte offsets at which a new page starts, if the parser knows them
  std::vector<size_t> page_breaks;
  // Re-embed even when the content hash is unchanged
  bool force = false;
};

struct IngestResult {
  std::string source_id;
  size_t chunk_count = 0;
  size_t embedded_count = 0;
  std::optional<EmbeddingTier> tier;
  // True when unchanged content was already indexed
  bool skipped = false;
};

/**
 * @brief Parsed text -> chunks -> embeddings -> vector shard.
 *
 * The source row and its chunks are always written to the metadata store. If
 * embedding fails the source stays searchable by title only and its old shard
 * is removed, so stale vectors never describe new content.
 */
class IngestionService {
 public:
  IngestionService(std::shared_ptr<SettingsStore> settings,
                   std::shared_ptr<MetadataStore> metadata_store,
                   std::shared_ptr<TieredEmbedder> embedder,
                   std::shared_ptr<VectorStore> vector_store);

  IngestResult ingest_source(const IngestRequest& request);

  // Re-embeds stored chunks with the currently active tier.
  IngestResult reembed_source(const std::string& notebook_id, const std::string& source_id);
  std::vector<IngestResult> reembed_notebook(const std::string& notebook_id);

  // Sources whose shard is missing or was written by a tier other than the active one.
  std::vector<std::string> stale_sources(const std::string& notebook_id);

  void delete_source(const std::string& notebook_id, const std::string& source_id);
  void delete_notebook(const std::string& notebook_id);

 private:
  IngestResult embed_and_store(const std::string& notebook_id,
                               const std::string& source_id,
                               const std::vector<Chunk>& chunks);

  std::shared_ptr<SettingsStore> settings_;
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<TieredEmbedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
  Chunker chunker_;
};

}  // namespace margin_core
