#include "margin_core/db/metadata_store.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "margin_core/db/pooled_connection.hpp"
#include "margin_core/db/sqlite_error_utils.hpp"
#include "margin_core/db/transaction.hpp"

namespace margin_core {

std::string MetadataStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point MetadataStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw MetadataStoreError("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

MetadataStore::MetadataStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void MetadataStore::upsert_notebook(const NotebookRecord &notebook) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO notebooks (id, title, created_at) VALUES (?,?,?) "
             "ON CONFLICT(id) DO UPDATE SET title=excluded.title"
          << notebook.id << notebook.title << time_point_to_string(notebook.created_at);
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("upsert_notebook", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

std::optional<NotebookRecord> MetadataStore::get_notebook(const std::string &notebook_id) {
  try {
    std::optional<NotebookRecord> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, title, created_at FROM notebooks WHERE id = ?" << notebook_id >>
        [&](std::string id, std::string title, std::string created_at) {
          result = NotebookRecord{std::move(id), std::move(title), string_to_time_point(created_at)};
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_notebook", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

std::vector<NotebookRecord> MetadataStore::list_notebooks() {
  try {
    std::vector<NotebookRecord> notebooks;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, title, created_at FROM notebooks ORDER BY created_at, id" >>
        [&](std::string id, std::string title, std::string created_at) {
          notebooks.push_back({std::move(id), std::move(title), string_to_time_point(created_at)});
        };
    return notebooks;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("list_notebooks", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

void MetadataStore::delete_notebook(const std::string &notebook_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM notebooks WHERE id = ?" << notebook_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("delete_notebook", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

void MetadataStore::upsert_source(const SourceRecord &source) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    bool notebook_exists = false;
    *conn << "SELECT 1 FROM notebooks WHERE id = ? LIMIT 1" << source.notebook_id >>
        [&](int /*dummy*/) { notebook_exists = true; };
    if (!notebook_exists) {
      throw MetadataStoreError("Notebook " + source.notebook_id + " not found");
    }

    *conn << "INSERT INTO sources (id, notebook_id, title, content, content_hash, created_at) "
             "VALUES (?,?,?,?,?,?) "
             "ON CONFLICT(id) DO UPDATE SET notebook_id=excluded.notebook_id, title=excluded.title, "
             "content=excluded.content, content_hash=excluded.content_hash"
          << source.id << source.notebook_id << source.title << source.content
          << source.content_hash << time_point_to_string(source.created_at);

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("upsert_source", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

std::optional<SourceRecord> MetadataStore::get_source(const std::string &source_id) {
  try {
    std::optional<SourceRecord> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, notebook_id, title, content, content_hash, created_at FROM sources "
             "WHERE id = ?"
          << source_id >>
        [&](std::string id, std::string notebook_id, std::string title, std::string content,
            std::string content_hash, std::string created_at) {
          result = SourceRecord{std::move(id),      std::move(notebook_id),  std::move(title),
                                std::move(content), std::move(content_hash), string_to_time_point(created_at)};
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_source", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

std::vector<SourceRecord> MetadataStore::list_sources(const std::string &notebook_id) {
  try {
    std::vector<SourceRecord> sources;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, notebook_id, title, content, content_hash, created_at FROM sources "
             "WHERE notebook_id = ? ORDER BY created_at, id"
          << notebook_id >>
        [&](std::string id, std::string nb_id, std::string title, std::string content,
            std::string content_hash, std::string created_at) {
          sources.push_back({std::move(id), std::move(nb_id), std::move(title), std::move(content),
                             std::move(content_hash), string_to_time_point(created_at)});
        };
    return sources;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("list_sources", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

void MetadataStore::delete_source(const std::string &source_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM sources WHERE id = ?" << source_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("delete_source", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

void MetadataStore::replace_chunks(const std::string &source_id, const std::vector<Chunk> &chunks) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);

    *conn << "DELETE FROM chunks WHERE source_id = ?" << source_id;

    if (!chunks.empty()) {
      auto insert = *conn << "INSERT INTO chunks (id, source_id, chunk_index, text, token_count, "
                             "page_number) VALUES (?,?,?,?,?,?)";
      for (const auto &chunk : chunks) {
        const std::string chunk_id =
            chunk.id.empty() ? source_id + ":" + std::to_string(chunk.chunk_index) : chunk.id;
        insert << chunk_id << source_id << chunk.chunk_index << chunk.text
               << chunk.token_count_estimate << chunk.page_number;
        insert++;
      }
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    if (is_foreign_key_violation(e)) {
      throw MetadataStoreError("Source " + source_id + " not found");
    }
    throw MetadataStoreError(format_db_error("replace_chunks", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

std::vector<Chunk> MetadataStore::get_chunks(const std::string &source_id) {
  try {
    std::vector<Chunk> chunks;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, source_id, chunk_index, text, token_count, page_number FROM chunks "
             "WHERE source_id = ? ORDER BY chunk_index"
          << source_id >>
        [&](std::string id, std::string src_id, int chunk_index, std::string text, int token_count,
            std::optional<int> page_number) {
          Chunk chunk;
          chunk.id = std::move(id);
          chunk.source_id = std::move(src_id);
          chunk.chunk_index = chunk_index;
          chunk.text = std::move(text);
          chunk.token_count_estimate = token_count;
          chunk.page_number = page_number;
          chunks.push_back(std::move(chunk));
        };
    return chunks;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_chunks", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

TitleMap MetadataStore::source_titles(const std::string &notebook_id) {
  try {
    TitleMap titles;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, title FROM sources WHERE notebook_id = ?" << notebook_id >>
        [&](std::string id, std::string title) { titles.emplace(std::move(id), std::move(title)); };
    return titles;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("source_titles", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

TitleMap MetadataStore::all_source_titles() {
  try {
    TitleMap titles;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, title FROM sources" >>
        [&](std::string id, std::string title) { titles.emplace(std::move(id), std::move(title)); };
    return titles;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("all_source_titles", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

TitleMap MetadataStore::notebook_titles() {
  try {
    TitleMap titles;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, title FROM notebooks" >>
        [&](std::string id, std::string title) { titles.emplace(std::move(id), std::move(title)); };
    return titles;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("notebook_titles", e));
  } catch (const ConnectionUnavailableError &e) {
    throw MetadataStoreError(e.what());
  }
}

}  // namespace margin_core
