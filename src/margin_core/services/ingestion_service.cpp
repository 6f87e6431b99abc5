#include "margin_core/services/ingestion_service.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include "margin_core/util/hashing.hpp"
#include "margin_core/util/text.hpp"

namespace margin_core {

IngestionService::IngestionService(std::shared_ptr<SettingsStore> settings,
                                   std::shared_ptr<MetadataStore> metadata_store,
                                   std::shared_ptr<TieredEmbedder> embedder,
                                   std::shared_ptr<VectorStore> vector_store)
    : settings_(std::move(settings)),
      metadata_store_(std::move(metadata_store)),
      embedder_(std::move(embedder)),
      vector_store_(std::move(vector_store)) {}

IngestResult IngestionService::ingest_source(const IngestRequest& request) {
  if (request.source_id.empty()) {
    throw IngestionError("Source id cannot be empty");
  }
  if (!metadata_store_->get_notebook(request.notebook_id)) {
    throw IngestionError("Notebook " + request.notebook_id + " does not exist");
  }

  const std::string text = text::sanitize_utf8(request.text);
  if (text::is_blank(text)) {
    throw IngestionError("No text could be extracted from this source.");
  }

  const std::string content_hash = sha256_hex(text);
  auto existing = metadata_store_->get_source(request.source_id);
  if (existing && !request.force && existing->notebook_id == request.notebook_id &&
      existing->content_hash == content_hash && vector_store_->has_source(request.notebook_id, request.source_id)) {
    std::cout << "[Ingestion] " << request.source_id << " unchanged, skipping" << std::endl;
    IngestResult result;
    result.source_id = request.source_id;
    result.skipped = true;
    result.chunk_count = metadata_store_->get_chunks(request.source_id).size();
    if (auto tag = vector_store_->source_tag(request.notebook_id, request.source_id)) {
      result.tier = tag->tier;
    }
    return result;
  }

  const Settings settings = settings_->current();
  ChunkOptions options;
  options.chunk_size = static_cast<size_t>(settings.chunk_size);
  options.overlap = static_cast<size_t>(settings.chunk_overlap);
  options.page_breaks = request.page_breaks;
  std::vector<Chunk> chunks = chunker_.chunk_source(request.source_id, text, options);

  SourceRecord record;
  record.id = request.source_id;
  record.notebook_id = request.notebook_id;
  record.title = text::is_blank(request.title) ? "Untitled source" : request.title;
  record.content = text;
  record.content_hash = content_hash;
  record.created_at = existing ? existing->created_at : std::chrono::system_clock::now();
  metadata_store_->upsert_source(record);
  metadata_store_->replace_chunks(request.source_id, chunks);

  if (existing && existing->notebook_id != request.notebook_id) {
    std::cout << "[Ingestion] " << request.source_id << " moved from " << existing->notebook_id << " to "
              << request.notebook_id << std::endl;
    vector_store_->delete_source(existing->notebook_id, request.source_id);
  }

  return embed_and_store(request.notebook_id, request.source_id, chunks);
}

IngestResult IngestionService::embed_and_store(const std::string& notebook_id,
                                               const std::string& source_id,
                                               const std::vector<Chunk>& chunks) {
  IngestResult result;
  result.source_id = source_id;
  result.chunk_count = chunks.size();

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.text);
  }

  EmbeddingResult embedding;
  try {
    embedding = embedder_->embed_tagged(texts);
  } catch (const std::exception& e) {
    std::cerr << "[Ingestion] Warning: embedding failed for " << source_id
              << ", source saved without vectors: " << e.what() << std::endl;
    vector_store_->delete_source(notebook_id, source_id);
    return result;
  }

  if (embedding.vectors.size() != chunks.size()) {
    std::cerr << "[Ingestion] Warning: got " << embedding.vectors.size() << " vectors for " << chunks.size()
              << " chunks of " << source_id << ", source saved without vectors" << std::endl;
    vector_store_->delete_source(notebook_id, source_id);
    return result;
  }

  vector_store_->add_documents(notebook_id, source_id, chunks, embedding.vectors, embedding.tag());
  result.embedded_count = chunks.size();
  result.tier = embedding.tier;
  std::cout << "[Ingestion] Indexed " << chunks.size() << " chunk(s) of " << source_id << " with the "
            << to_string(embedding.tier) << " tier" << std::endl;
  return result;
}

IngestResult IngestionService::reembed_source(const std::string& notebook_id, const std::string& source_id) {
  auto source = metadata_store_->get_source(source_id);
  if (!source || source->notebook_id != notebook_id) {
    throw IngestionError("Source " + source_id + " not found in notebook " + notebook_id);
  }
  return embed_and_store(notebook_id, source_id, metadata_store_->get_chunks(source_id));
}

std::vector<IngestResult> IngestionService::reembed_notebook(const std::string& notebook_id) {
  std::vector<IngestResult> results;
  for (const auto& source_id : stale_sources(notebook_id)) {
    results.push_back(reembed_source(notebook_id, source_id));
  }
  return results;
}

std::vector<std::string> IngestionService::stale_sources(const std::string& notebook_id) {
  const EmbeddingTier active = embedder_->get_active_model();
  std::vector<std::string> stale;
  for (const auto& source : metadata_store_->list_sources(notebook_id)) {
    auto tag = vector_store_->source_tag(notebook_id, source.id);
    if (!tag || tag->tier != active) {
      stale.push_back(source.id);
    }
  }
  return stale;
}

void IngestionService::delete_source(const std::string& notebook_id, const std::string& source_id) {
  vector_store_->delete_source(notebook_id, source_id);
  metadata_store_->delete_source(source_id);
}

void IngestionService::delete_notebook(const std::string& notebook_id) {
  vector_store_->delete_notebook(notebook_id);
  metadata_store_->delete_notebook(notebook_id);
}

}  // namespace margin_core
