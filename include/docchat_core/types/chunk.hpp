#pragma once

#include <string>

namespace docchat_core {

struct Chunk {
  std::string key;
  std::string text;
  std::string source_document_id;
  int ordinal = 0;
};

inline std::string make_chunk_key(const std::string &document_id, int ordinal) {
  return document_id + ":" + std::to_string(ordinal);
}

}  // namespace docchat_core
