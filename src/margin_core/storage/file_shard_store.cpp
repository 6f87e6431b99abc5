#include "margin_core/storage/file_shard_store.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "margin_core/storage/shard_codec.hpp"

namespace margin_core {

namespace {

bool has_suffix(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

FileShardStore::FileShardStore(const std::filesystem::path& root_dir) : root_dir_(root_dir) {
  std::error_code ec;
  std::filesystem::create_directories(root_dir_, ec);
  if (ec) {
    throw ShardStoreError("Failed to create vector store directory " + root_dir_.string() + ": " +
                          ec.message());
  }
}

void FileShardStore::validate_id(const std::string& id, const char* what) {
  if (id.empty() || id == "." || id == ".." ||
      id.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
    throw std::invalid_argument(std::string("Invalid ") + what + ": '" + id + "'");
  }
}

std::filesystem::path FileShardStore::notebook_dir(const std::string& notebook_id) const {
  validate_id(notebook_id, "notebook id");
  return root_dir_ / notebook_id;
}

std::filesystem::path FileShardStore::shard_path(const std::string& notebook_id,
                                                 const std::string& source_id) const {
  validate_id(source_id, "source id");
  return notebook_dir(notebook_id) / (source_id + SHARD_EXTENSION);
}

std::shared_ptr<std::mutex> FileShardStore::shard_lock(const std::string& notebook_id,
                                                       const std::string& source_id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto& entry = shard_locks_[notebook_id + "/" + source_id];
  if (!entry) {
    entry = std::make_shared<std::mutex>();
  }
  return entry;
}

std::optional<VectorShard> FileShardStore::get(const std::string& notebook_id,
                                               const std::string& source_id) {
  const auto path = shard_path(notebook_id, source_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw ShardStoreError("Could not open shard: " + path.string());
  }
  std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw ShardStoreError("Failed to read shard: " + path.string());
  }

  try {
    VectorShard shard = ShardCodec::decode(bytes);
    if (shard.source_id.empty()) {
      shard.source_id = source_id;
    }
    return shard;
  } catch (const ShardStoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw ShardStoreError("Failed to decode shard " + path.string() + ": " + e.what());
  }
}

void FileShardStore::put(const std::string& notebook_id, const VectorShard& shard) {
  const auto path = shard_path(notebook_id, shard.source_id);
  const std::vector<char> bytes = ShardCodec::encode(shard);

  auto lock_ptr = shard_lock(notebook_id, shard.source_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw ShardStoreError("Failed to create notebook directory: " + ec.message());
  }

  const auto temp_path = path.parent_path() /
                         (path.filename().string() + ".tmp." +
                          std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + "." +
                          std::to_string(temp_counter_.fetch_add(1)));
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw ShardStoreError("Could not open temporary shard file: " + temp_path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::filesystem::remove(temp_path, ec);
      throw ShardStoreError("Failed to write shard: " + temp_path.string());
    }
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    throw ShardStoreError("Failed to move shard into place: " + ec.message());
  }
}

bool FileShardStore::remove(const std::string& notebook_id, const std::string& source_id) {
  const auto path = shard_path(notebook_id, source_id);
  auto lock_ptr = shard_lock(notebook_id, source_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw ShardStoreError("Failed to delete shard " + path.string() + ": " + ec.message());
  }
  return removed;
}

bool FileShardStore::remove_notebook(const std::string& notebook_id) {
  const auto dir = notebook_dir(notebook_id);
  std::error_code ec;
  auto removed = std::filesystem::remove_all(dir, ec);
  if (ec) {
    throw ShardStoreError("Failed to delete notebook " + dir.string() + ": " + ec.message());
  }
  return removed > 0;
}

std::vector<std::string> FileShardStore::list_shards(const std::string& notebook_id) {
  std::vector<std::string> source_ids;
  const auto dir = notebook_dir(notebook_id);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return source_ids;
  }

  const std::string extension = SHARD_EXTENSION;
  std::filesystem::directory_iterator it(dir, ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    std::string name = it->path().filename().string();
    if (has_suffix(name, extension)) {
      source_ids.push_back(name.substr(0, name.size() - extension.size()));
    }
  }
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return {};
    }
    throw ShardStoreError("Failed to list shards in " + dir.string() + ": " + ec.message());
  }
  std::sort(source_ids.begin(), source_ids.end());
  return source_ids;
}

std::vector<std::string> FileShardStore::list_notebooks() {
  std::vector<std::string> notebook_ids;
  std::error_code ec;
  std::filesystem::directory_iterator it(root_dir_, ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      notebook_ids.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    throw ShardStoreError("Failed to list notebooks in " + root_dir_.string() + ": " + ec.message());
  }
  std::sort(notebook_ids.begin(), notebook_ids.end());
  return notebook_ids;
}

}  // namespace margin_core
