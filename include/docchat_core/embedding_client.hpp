#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/llm/embedding_provider.hpp"
#include "docchat_core/types/call_options.hpp"

namespace docchat_core {

struct EmbeddingBatchLimits {
  size_t max_batch_texts = 64;
  size_t max_batch_chars = 100000;
  size_t max_concurrent_batches = 4;
};

// A contiguous slice [offset, offset + count) of the caller's input.
struct EmbeddingBatch {
  size_t offset;
  size_t count;
};

/**
 * @class EmbeddingClient
 * @brief Turns texts into vectors through an EmbeddingProvider.
 *
 * embed_many() never issues one call per text: inputs are packed into
 * batches bounded by the configured limits, the batches are sent
 * concurrently, and every result is written back at its batch offset so the
 * output order always matches the input order. The client does not retry;
 * a failed batch fails the whole call.
 */
class EmbeddingClient {
 public:
  EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider, EmbeddingBatchLimits limits = {});
  virtual ~EmbeddingClient() = default;

  EmbeddingClient(const EmbeddingClient &) = delete;
  EmbeddingClient &operator=(const EmbeddingClient &) = delete;

  virtual std::vector<float> embed_one(const std::string &text, const CallOptions &options);

  virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts,
                                                     const CallOptions &options);

  std::vector<EmbeddingBatch> plan_batches(const std::vector<std::string> &texts) const;

  const EmbeddingBatchLimits &limits() const {
    return limits_;
  }

 private:
  std::vector<std::vector<float>> run_batch(const std::vector<std::string> &texts,
                                            const EmbeddingBatch &batch,
                                            const CallOptions &options);

  std::shared_ptr<EmbeddingProvider> provider_;
  EmbeddingBatchLimits limits_;
};

}  // namespace docchat_core
