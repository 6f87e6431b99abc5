#include "margin_core/storage/vector_store.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "margin_core/storage/similarity.hpp"

namespace margin_core {

VectorStore::VectorStore(std::shared_ptr<ShardStore> shard_store) : shard_store_(std::move(shard_store)) {
  if (!shard_store_) {
    throw VectorStoreError("VectorStore requires a shard store");
  }
}

void VectorStore::add_documents(const std::string& notebook_id,
                                const std::string& source_id,
                                const std::vector<Chunk>& chunks,
                                const std::vector<Embedding>& vectors,
                                const std::optional<EmbeddingTag>& tag) {
  if (chunks.size() != vectors.size()) {
    throw VectorStoreError("Cannot store " + std::to_string(chunks.size()) + " chunks with " +
                           std::to_string(vectors.size()) + " vectors");
  }

  VectorShard shard;
  shard.source_id = source_id;
  shard.embedding = tag;

  size_t skipped = 0;
  std::optional<size_t> dimension;
  if (tag) {
    dimension = tag->dimension;
  }

  for (size_t i = 0; i < chunks.size(); ++i) {
    if (vectors[i].empty()) {
      ++skipped;
      continue;
    }
    if (!dimension) {
      dimension = vectors[i].size();
    } else if (vectors[i].size() != *dimension) {
      throw VectorStoreError("Vector " + std::to_string(i) + " has dimension " +
                             std::to_string(vectors[i].size()) + ", expected " + std::to_string(*dimension));
    }

    const Chunk& chunk = chunks[i];
    ShardEntry entry;
    entry.id = chunk.id.empty() ? source_id + ":" + std::to_string(chunk.chunk_index) : chunk.id;
    entry.source_id = source_id;
    entry.text = chunk.text;
    entry.vector = vectors[i];
    entry.chunk_index = chunk.chunk_index;
    entry.page_number = chunk.page_number;
    shard.entries.push_back(std::move(entry));
  }

  if (skipped > 0) {
    std::cerr << "[VectorStore] Warning: " << skipped << " chunk(s) of " << notebook_id << "/" << source_id
              << " have no embedding and were not indexed" << std::endl;
  }

  try {
    shard_store_->put(notebook_id, shard);
  } catch (const ShardStoreError& e) {
    throw VectorStoreError("Failed to store vectors for " + source_id + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw VectorStoreError(e.what());
  }
}

std::vector<SearchHit> VectorStore::search(const std::string& notebook_id,
                                           const Embedding& query_vector,
                                           size_t limit,
                                           const std::optional<std::vector<std::string>>& source_filter,
                                           const std::optional<EmbeddingTag>& query_tag) {
  std::vector<SearchHit> hits;
  if (limit == 0 || query_vector.empty()) {
    return hits;
  }

  std::unordered_set<std::string> filter;
  if (source_filter) {
    filter.insert(source_filter->begin(), source_filter->end());
  }
  scan_notebook(notebook_id, query_vector, query_tag, source_filter ? &filter : nullptr, hits);
  rank(hits, limit);
  return hits;
}

std::vector<SearchHit> VectorStore::search_multiple(const std::vector<std::string>& notebook_ids,
                                                    const Embedding& query_vector,
                                                    size_t limit,
                                                    const std::optional<EmbeddingTag>& query_tag) {
  std::vector<SearchHit> hits;
  if (limit == 0 || query_vector.empty()) {
    return hits;
  }
  for (const auto& notebook_id : notebook_ids) {
    scan_notebook(notebook_id, query_vector, query_tag, nullptr, hits);
  }
  rank(hits, limit);
  return hits;
}

void VectorStore::scan_notebook(const std::string& notebook_id,
                                const Embedding& query_vector,
                                const std::optional<EmbeddingTag>& query_tag,
                                const std::unordered_set<std::string>* source_filter,
                                std::vector<SearchHit>& hits) {
  std::vector<std::string> source_ids;
  try {
    source_ids = shard_store_->list_shards(notebook_id);
  } catch (const ShardStoreError& e) {
    std::cerr << "[VectorStore] Warning: cannot list shards of notebook " << notebook_id << ": " << e.what() << std::endl;
    return;
  } catch (const std::invalid_argument& e) {
    throw VectorStoreError(e.what());
  }

  for (const auto& source_id : source_ids) {
    if (source_filter && source_filter->count(source_id) == 0) {
      continue;
    }

    std::optional<VectorShard> shard;
    try {
      shard = shard_store_->get(notebook_id, source_id);
    } catch (const ShardStoreError& e) {
      std::cerr << "[VectorStore] Warning: skipping unreadable shard " << notebook_id << "/" << source_id << ": "
                << e.what() << std::endl;
      continue;
    }
    if (!shard) {
      continue;
    }

    if (query_tag && shard->embedding && shard->embedding->tier != query_tag->tier) {
      std::cerr << "[VectorStore] Skipping " << notebook_id << "/" << source_id << ": embedded with "
                << to_string(shard->embedding->tier) << ", query uses " << to_string(query_tag->tier)
                << std::endl;
      continue;
    }

    for (auto& entry : shard->entries) {
      if (entry.vector.size() != query_vector.size()) {
        continue;
      }
      SearchHit hit;
      hit.id = std::move(entry.id);
      hit.notebook_id = notebook_id;
      hit.source_id = entry.source_id.empty() ? source_id : std::move(entry.source_id);
      hit.text = std::move(entry.text);
      hit.score = cosine_similarity(query_vector, entry.vector);
      hit.chunk_index = entry.chunk_index;
      hit.page_number = entry.page_number;
      hits.push_back(std::move(hit));
    }
  }
}

void VectorStore::rank(std::vector<SearchHit>& hits, size_t limit) {
  std::stable_sort(hits.begin(), hits.end(),
                   [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });
  if (hits.size() > limit) {
    hits.resize(limit);
  }
}

void VectorStore::delete_source(const std::string& notebook_id, const std::string& source_id) {
  try {
    shard_store_->remove(notebook_id, source_id);
  } catch (const ShardStoreError& e) {
    throw VectorStoreError("Failed to delete vectors for " + source_id + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw VectorStoreError(e.what());
  }
}

void VectorStore::delete_notebook(const std::string& notebook_id) {
  try {
    shard_store_->remove_notebook(notebook_id);
  } catch (const ShardStoreError& e) {
    throw VectorStoreError("Failed to delete vectors for notebook " + notebook_id + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw VectorStoreError(e.what());
  }
}

bool VectorStore::has_source(const std::string& notebook_id, const std::string& source_id) {
  auto source_ids = list_sources(notebook_id);
  return std::binary_search(source_ids.begin(), source_ids.end(), source_id);
}

std::vector<std::string> VectorStore::list_sources(const std::string& notebook_id) {
  try {
    return shard_store_->list_shards(notebook_id);
  } catch (const ShardStoreError& e) {
    throw VectorStoreError(e.what());
  } catch (const std::invalid_argument& e) {
    throw VectorStoreError(e.what());
  }
}

std::vector<std::string> VectorStore::list_notebooks() {
  try {
    return shard_store_->list_notebooks();
  } catch (const ShardStoreError& e) {
    throw VectorStoreError(e.what());
  }
}

std::optional<EmbeddingTag> VectorStore::source_tag(const std::string& notebook_id,
                                                    const std::string& source_id) {
  try {
    auto shard = shard_store_->get(notebook_id, source_id);
    if (!shard) {
      return std::nullopt;
    }
    return shard->embedding;
  } catch (const ShardStoreError& e) {
    std::cerr << "[VectorStore] Warning: unreadable shard " << notebook_id << "/" << source_id << ": " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

}  // namespace margin_core
