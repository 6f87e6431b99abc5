#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "margin_core/storage/vector_shard.hpp"

namespace margin_core {

// On-disk encoding of a VectorShard: a JSON document compressed with Zstandard.
class ShardCodec {
 public:
  static constexpr int FORMAT_VERSION = 1;
  // Decoded shards larger than this are treated as corrupt
  static constexpr size_t MAX_DECOMPRESSED_BYTES = 256ull * 1024 * 1024;

  /**
   * @brief Serializes a shard to compressed bytes.
   * @param shard The shard to encode.
   * @param compression_level The zstd compression level (default is 3).
   */
  static std::vector<char> encode(const VectorShard& shard, int compression_level = 3);

  /**
   * @brief Parses compressed bytes back into a shard.
   * @throws ShardStoreError if the data is not zstd, not JSON, or misses required fields.
   */
  static VectorShard decode(const std::vector<char>& bytes);

 private:
  static std::vector<char> compress(std::string_view data, int compression_level);
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace margin_core
