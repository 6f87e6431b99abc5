#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "margin_core/types/chunk.hpp"

namespace margin_core {

struct ChunkOptions {
  // Window size and overlap, in estimated tokens
  size_t chunk_size = 500;
  size_t overlap = 100;
  // Sorted byte offsets at which a new page begins. When empty, chunks carry no
  // page number.
  std::vector<size_t> page_breaks;
};

/**
 * @brief Splits plain text into overlapping, sentence-aligned chunks.
 *
 * Sentences are accumulated until the window reaches chunk_size tokens. After
 * each emitted chunk the trailing sentences whose combined length stays within
 * the overlap budget seed the next window. A single sentence longer than the
 * window is emitted whole.
 */
class Chunker {
 public:
  static constexpr size_t CHARS_PER_TOKEN = 4;

  std::vector<Chunk> chunk(const std::string& text, const ChunkOptions& options = {}) const;

  // Same as chunk(), with source_id and "<source_id>:<index>" ids filled in.
  std::vector<Chunk> chunk_source(const std::string& source_id,
                                  const std::string& text,
                                  const ChunkOptions& options = {}) const;

  static int estimate_tokens(const std::string& text);

 private:
  struct Sentence {
    std::string text;
    size_t offset;
    size_t length;
  };

  static std::vector<Sentence> split_sentences(const std::string& text);
  static std::optional<int> page_for_offset(size_t offset, const std::vector<size_t>& page_breaks);
};

}  // namespace margin_core
