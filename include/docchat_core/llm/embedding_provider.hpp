#pragma once

#include <string>
#include <vector>

#include "docchat_core/types/call_options.hpp"

namespace docchat_core {

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Embeds every text with a single network call. Returns one vector per
  // input, in input order.
  // Throws EmbeddingProviderError on transport or provider failure.
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts,
                                                      const CallOptions &options) = 0;
};

}  // namespace docchat_core
