#include "margin_core/chunking/chunker.hpp"

#include <algorithm>
#include <cctype>

#include "margin_core/util/text.hpp"

namespace margin_core {

namespace {

bool is_terminator(char c) {
  return c == '.' || c == '!' || c == '?';
}

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

int Chunker::estimate_tokens(const std::string& text) {
  const size_t chars = text::char_length(text);
  return static_cast<int>((chars + CHARS_PER_TOKEN - 1) / CHARS_PER_TOKEN);
}

// A sentence ends at '.', '!' or '?' followed by whitespace. The whitespace run
// between sentences is dropped.
std::vector<Chunker::Sentence> Chunker::split_sentences(const std::string& text) {
  std::vector<Sentence> sentences;
  size_t start = 0;
  const size_t n = text.size();

  auto push = [&](size_t begin, size_t end) {
    std::string piece = text.substr(begin, end - begin);
    if (text::is_blank(piece)) {
      return;
    }
    size_t length = text::char_length(piece);
    sentences.push_back({std::move(piece), begin, length});
  };

  for (size_t i = 0; i < n; ++i) {
    if (!is_terminator(text[i]) || i + 1 >= n || !is_space(text[i + 1])) {
      continue;
    }
    push(start, i + 1);
    size_t next = i + 1;
    while (next < n && is_space(text[next])) {
      ++next;
    }
    start = next;
    i = next - 1;
  }
  if (start < n) {
    push(start, n);
  }
  return sentences;
}

std::optional<int> Chunker::page_for_offset(size_t offset, const std::vector<size_t>& page_breaks) {
  if (page_breaks.empty()) {
    return std::nullopt;
  }
  auto it = std::upper_bound(page_breaks.begin(), page_breaks.end(), offset);
  return static_cast<int>(it - page_breaks.begin()) + 1;
}

std::vector<Chunk> Chunker::chunk(const std::string& text, const ChunkOptions& options) const {
  std::vector<Chunk> chunks;
  const std::string clean = text::sanitize_utf8(text);
  const std::vector<Sentence> sentences = split_sentences(clean);
  if (sentences.empty()) {
    return chunks;
  }

  const size_t target_chars = std::max<size_t>(1, options.chunk_size * CHARS_PER_TOKEN);
  const size_t overlap_chars = options.overlap * CHARS_PER_TOKEN;

  // Indices into sentences
  std::vector<size_t> window;
  size_t window_chars = 0;
  // True once the window holds a sentence that has not been emitted yet
  bool has_fresh = false;

  auto emit = [&]() {
    std::string joined;
    for (size_t idx : window) {
      if (!joined.empty()) {
        joined += ' ';
      }
      joined += sentences[idx].text;
    }
    joined = text::trim(joined);
    if (joined.empty()) {
      return;
    }
    Chunk chunk;
    chunk.chunk_index = static_cast<int>(chunks.size());
    chunk.token_count_estimate = estimate_tokens(joined);
    chunk.page_number = page_for_offset(sentences[window.front()].offset, options.page_breaks);
    chunk.text = std::move(joined);
    chunks.push_back(std::move(chunk));
  };

  for (size_t i = 0; i < sentences.size(); ++i) {
    window.push_back(i);
    window_chars += sentences[i].length;
    has_fresh = true;

    if (window_chars < target_chars) {
      continue;
    }
    emit();

    // Seed the next window with trailing sentences that fit the overlap budget
    std::vector<size_t> seed;
    size_t seed_chars = 0;
    for (auto it = window.rbegin(); it != window.rend(); ++it) {
      if (seed_chars + sentences[*it].length > overlap_chars) {
        break;
      }
      seed_chars += sentences[*it].length;
      seed.insert(seed.begin(), *it);
    }
    window = std::move(seed);
    window_chars = seed_chars;
    has_fresh = false;
  }

  if (has_fresh && !window.empty()) {
    emit();
  }
  return chunks;
}

std::vector<Chunk> Chunker::chunk_source(const std::string& source_id,
                                         const std::string& text,
                                         const ChunkOptions& options) const {
  std::vector<Chunk> chunks = chunk(text, options);
  for (auto& chunk : chunks) {
    chunk.source_id = source_id;
    chunk.id = source_id + ":" + std::to_string(chunk.chunk_index);
  }
  return chunks;
}

}  // namespace margin_core
