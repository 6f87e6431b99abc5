#pragma once

#include <optional>
#include <string>
#include <vector>

#include "margin_core/storage/vector_shard.hpp"

namespace margin_core {

class ShardStoreError : public std::exception {
 public:
  explicit ShardStoreError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Persistence seam for vector shards, keyed by (notebook_id, source_id).
class ShardStore {
 public:
  virtual ~ShardStore() = default;

  // nullopt when the shard does not exist. Throws ShardStoreError when it
  // exists but cannot be read or decoded.
  virtual std::optional<VectorShard> get(const std::string& notebook_id, const std::string& source_id) = 0;

  // Replaces the shard atomically: readers observe the old or the new shard, never a mix.
  virtual void put(const std::string& notebook_id, const VectorShard& shard) = 0;

  // Returns false when nothing was removed.
  virtual bool remove(const std::string& notebook_id, const std::string& source_id) = 0;
  virtual bool remove_notebook(const std::string& notebook_id) = 0;

  // Source ids in a notebook, sorted. Empty for unknown notebooks.
  virtual std::vector<std::string> list_shards(const std::string& notebook_id) = 0;
  virtual std::vector<std::string> list_notebooks() = 0;
};

}  // namespace margin_core
