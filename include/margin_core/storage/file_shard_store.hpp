#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "margin_core/storage/shard_store.hpp"

namespace margin_core {

// Shards on the local filesystem as <root>/<notebook_id>/<source_id>.json.zst.
// Writes go to a temporary file in the same directory and are renamed into
// place; writers to the same shard are serialized.
class FileShardStore : public ShardStore {
 public:
  static constexpr const char* SHARD_EXTENSION = ".json.zst";

  explicit FileShardStore(const std::filesystem::path& root_dir);

  std::optional<VectorShard> get(const std::string& notebook_id, const std::string& source_id) override;
  void put(const std::string& notebook_id, const VectorShard& shard) override;
  bool remove(const std::string& notebook_id, const std::string& source_id) override;
  bool remove_notebook(const std::string& notebook_id) override;
  std::vector<std::string> list_shards(const std::string& notebook_id) override;
  std::vector<std::string> list_notebooks() override;

  const std::filesystem::path& root_dir() const {
    return root_dir_;
  }

  std::filesystem::path shard_path(const std::string& notebook_id, const std::string& source_id) const;

 private:
  std::filesystem::path notebook_dir(const std::string& notebook_id) const;
  std::shared_ptr<std::mutex> shard_lock(const std::string& notebook_id, const std::string& source_id);

  // Ids become path components, so separators and dot segments are rejected.
  static void validate_id(const std::string& id, const char* what);

  std::filesystem::path root_dir_;
  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> shard_locks_;
  std::atomic<uint64_t> temp_counter_{0};
};

}  // namespace margin_core
