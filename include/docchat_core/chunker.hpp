#pragma once

#include <string>
#include <vector>

#include "docchat_core/types/chunk.hpp"

namespace docchat_core {

struct ChunkingOptions {
  int chunk_size = 1000;
  int overlap = 200;
};

class TextChunker {
 public:
  /**
   * @brief Splits a document into overlapping fixed-size character windows.
   *
   * Sizes count UTF-8 code points, so a window never ends inside a multi-byte
   * sequence. Consecutive windows share `overlap` characters and the last
   * window may be shorter than `chunk_size`. Windowing stops at the first
   * window that reaches the end of the text.
   *
   * @throws ConfigurationError if chunk_size <= 0, overlap < 0 or
   *         overlap >= chunk_size.
   * @throws InvalidArgumentError if the text is not valid UTF-8.
   */
  static std::vector<Chunk> chunk(const std::string &document_id,
                                  const std::string &text,
                                  int chunk_size,
                                  int overlap);

  static std::vector<Chunk> chunk(const std::string &document_id,
                                  const std::string &text,
                                  const ChunkingOptions &options) {
    return chunk(document_id, text, options.chunk_size, options.overlap);
  }

  static void validate(int chunk_size, int overlap);
};

}  // namespace docchat_core
