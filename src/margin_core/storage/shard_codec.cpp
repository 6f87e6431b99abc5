#include "margin_core/storage/shard_codec.hpp"

#include <zstd.h>

#include <memory>

#include <nlohmann/json.hpp>

#include "margin_core/storage/shard_store.hpp"

namespace margin_core {

std::vector<char> ShardCodec::encode(const VectorShard& shard, int compression_level) {
  nlohmann::json doc;
  doc["format_version"] = FORMAT_VERSION;
  doc["source_id"] = shard.source_id;
  if (shard.embedding) {
    doc["embedding"] = {{"tier", to_string(shard.embedding->tier)},
                        {"dimension", shard.embedding->dimension}};
  }

  nlohmann::json chunks = nlohmann::json::array();
  for (const auto& entry : shard.entries) {
    nlohmann::json item = {
        {"id", entry.id},
        {"sourceId", entry.source_id},
        {"text", entry.text},
        {"vector", entry.vector},
        {"chunkIndex", entry.chunk_index},
    };
    if (entry.page_number) {
      item["pageNumber"] = *entry.page_number;
    }
    chunks.push_back(std::move(item));
  }
  doc["chunks"] = std::move(chunks);

  const std::string serialized = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return compress(serialized, compression_level);
}

VectorShard ShardCodec::decode(const std::vector<char>& bytes) {
  const std::string serialized = decompress(bytes);

  nlohmann::json doc = nlohmann::json::parse(serialized, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw ShardStoreError("Shard is not a valid JSON document");
  }

  try {
    const int version = doc.value("format_version", FORMAT_VERSION);
    if (version > FORMAT_VERSION) {
      throw ShardStoreError("Unsupported shard format version " + std::to_string(version));
    }

    VectorShard shard;
    shard.source_id = doc.value("source_id", std::string());
    if (doc.contains("embedding") && doc["embedding"].is_object()) {
      const auto& embedding = doc["embedding"];
      shard.embedding = EmbeddingTag{embedding_tier_from_string(embedding.at("tier").get<std::string>()),
                                     embedding.at("dimension").get<size_t>()};
    }

    for (const auto& item : doc.at("chunks")) {
      ShardEntry entry;
      entry.id = item.at("id").get<std::string>();
      entry.source_id = item.value("sourceId", shard.source_id);
      entry.text = item.at("text").get<std::string>();
      entry.vector = item.at("vector").get<Embedding>();
      entry.chunk_index = item.value("chunkIndex", 0);
      if (item.contains("pageNumber") && item["pageNumber"].is_number_integer()) {
        entry.page_number = item["pageNumber"].get<int>();
      }
      shard.entries.push_back(std::move(entry));
    }
    return shard;
  } catch (const nlohmann::json::exception& e) {
    throw ShardStoreError("Malformed shard: " + std::string(e.what()));
  } catch (const std::invalid_argument& e) {
    throw ShardStoreError("Malformed shard: " + std::string(e.what()));
  }
}

std::vector<char> ShardCodec::compress(std::string_view data, int compression_level) {
  const size_t worst_case_size = ZSTD_compressBound(data.size());
  std::vector<char> compressed_buffer(worst_case_size);

  const size_t compressed_size = ZSTD_compress(compressed_buffer.data(), compressed_buffer.size(),
                                               data.data(), data.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw ShardStoreError("ZSTD compression failed: " + std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed_buffer.resize(compressed_size);
  return compressed_buffer;
}

std::string ShardCodec::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    throw ShardStoreError("Shard file is empty");
  }

  const unsigned long long content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR) {
    throw ShardStoreError("Shard data is not in zstd format");
  }

  if (content_size != ZSTD_CONTENTSIZE_UNKNOWN) {
    if (content_size > MAX_DECOMPRESSED_BYTES) {
      throw ShardStoreError("Shard declares " + std::to_string(content_size) +
                            " decompressed bytes, limit is " + std::to_string(MAX_DECOMPRESSED_BYTES));
    }
    std::string decompressed(content_size, '\0');
    const size_t actual_size = ZSTD_decompress(decompressed.data(), decompressed.size(),
                                               compressed_data.data(), compressed_data.size());
    if (ZSTD_isError(actual_size) || actual_size != content_size) {
      throw ShardStoreError("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(actual_size)));
    }
    return decompressed;
  }

  // Frames written by streaming encoders do not record their size
  std::unique_ptr<ZSTD_DStream, decltype(&ZSTD_freeDStream)> stream(ZSTD_createDStream(),
                                                                    &ZSTD_freeDStream);
  if (!stream) {
    throw ShardStoreError("Failed to create zstd decompression stream");
  }
  ZSTD_initDStream(stream.get());

  std::string decompressed;
  std::vector<char> out_buffer(ZSTD_DStreamOutSize());
  ZSTD_inBuffer input{compressed_data.data(), compressed_data.size(), 0};
  size_t last_result = 0;
  while (input.pos < input.size) {
    ZSTD_outBuffer output{out_buffer.data(), out_buffer.size(), 0};
    last_result = ZSTD_decompressStream(stream.get(), &output, &input);
    if (ZSTD_isError(last_result)) {
      throw ShardStoreError("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(last_result)));
    }
    if (decompressed.size() + output.pos > MAX_DECOMPRESSED_BYTES) {
      throw ShardStoreError("Shard exceeds " + std::to_string(MAX_DECOMPRESSED_BYTES) + " decompressed bytes");
    }
    decompressed.append(out_buffer.data(), output.pos);
  }
  if (last_result != 0) {
    throw ShardStoreError("Truncated zstd frame");
  }
  return decompressed;
}

}  // namespace margin_core
