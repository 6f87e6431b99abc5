#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "margin_core/db/database_manager.hpp"
#include "margin_core/types/chunk.hpp"
#include "margin_core/types/retrieval.hpp"

namespace margin_core {

class MetadataStoreError : public std::exception {
 public:
  explicit MetadataStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct NotebookRecord {
  std::string id;
  std::string title;
  std::chrono::system_clock::time_point created_at;
};

struct SourceRecord {
  std::string id;
  std::string notebook_id;
  std::string title;
  std::string content;
  std::string content_hash;
  std::chrono::system_clock::time_point created_at;
};

// Relational metadata: notebooks, their sources, and the chunk text derived
// from each source. Vectors live in the VectorStore.
class MetadataStore {
 public:
  explicit MetadataStore(DatabaseManager &db_manager);

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  void upsert_notebook(const NotebookRecord &notebook);
  std::optional<NotebookRecord> get_notebook(const std::string &notebook_id);
  std::vector<NotebookRecord> list_notebooks();
  // Cascades to the notebook's sources and chunks
  void delete_notebook(const std::string &notebook_id);

  // Throws MetadataStoreError if the notebook does not exist
  void upsert_source(const SourceRecord &source);
  std::optional<SourceRecord> get_source(const std::string &source_id);
  std::vector<SourceRecord> list_sources(const std::string &notebook_id);
  void delete_source(const std::string &source_id);

  // Replaces every chunk row of the source in one transaction
  void replace_chunks(const std::string &source_id, const std::vector<Chunk> &chunks);
  std::vector<Chunk> get_chunks(const std::string &source_id);

  TitleMap source_titles(const std::string &notebook_id);
  TitleMap all_source_titles();
  TitleMap notebook_titles();

 private:
  DatabaseManager &db_manager_;

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);
};

}  // namespace margin_core
