#include "docchat_core/chunker.hpp"

#include <utf8.h>

#include <algorithm>

#include "docchat_core/errors.hpp"

namespace docchat_core {

void TextChunker::validate(int chunk_size, int overlap) {
  if (chunk_size <= 0) {
    throw ConfigurationError("chunk_size must be greater than 0, got " +
                             std::to_string(chunk_size));
  }
  if (overlap < 0) {
    throw ConfigurationError("overlap cannot be negative, got " + std::to_string(overlap));
  }
  if (overlap >= chunk_size) {
    throw ConfigurationError("overlap (" + std::to_string(overlap) +
                             ") must be smaller than chunk_size (" +
                             std::to_string(chunk_size) + ")");
  }
}

std::vector<Chunk> TextChunker::chunk(const std::string &document_id,
                                      const std::string &text,
                                      int chunk_size,
                                      int overlap) {
  validate(chunk_size, overlap);

  std::vector<Chunk> out;
  if (text.empty()) {
    return out;
  }

  if (utf8::find_invalid(text.begin(), text.end()) != text.end()) {
    throw InvalidArgumentError("Document '" + document_id + "' is not valid UTF-8 text");
  }

  // Byte offset of every code point, plus one past the end.
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  offsets.push_back(text.size());

  const size_t char_count = offsets.size() - 1;
  const size_t window = static_cast<size_t>(chunk_size);
  const size_t step = static_cast<size_t>(chunk_size - overlap);

  int ordinal = 0;
  for (size_t start = 0; start < char_count; start += step) {
    const size_t end = std::min(start + window, char_count);
    Chunk chunk;
    chunk.key = make_chunk_key(document_id, ordinal);
    chunk.text = text.substr(offsets[start], offsets[end] - offsets[start]);
    chunk.source_document_id = document_id;
    chunk.ordinal = ordinal;
    out.push_back(std::move(chunk));
    ++ordinal;
    if (end == char_count) {
      break;
    }
  }

  return out;
}

}  // namespace docchat_core
