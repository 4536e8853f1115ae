#include "docchat_core/embedding_client.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>

#include "docchat_core/errors.hpp"

namespace docchat_core {

namespace {

// Provider seams may leak library exceptions; callers only ever see the
// documented taxonomy.
[[noreturn]] void rethrow_as_provider_error(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const DocchatError &) {
    throw;
  } catch (const std::exception &e) {
    throw EmbeddingProviderError(std::string("Embedding provider failed: ") + e.what());
  }
}

}  // namespace

EmbeddingClient::EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider,
                                 EmbeddingBatchLimits limits)
    : provider_(std::move(provider)), limits_(limits) {
  if (!provider_) {
    throw ConfigurationError("EmbeddingClient requires a provider");
  }
  if (limits_.max_batch_texts == 0 || limits_.max_batch_chars == 0 ||
      limits_.max_concurrent_batches == 0) {
    throw ConfigurationError("Embedding batch limits must all be greater than 0");
  }
}

std::vector<float> EmbeddingClient::embed_one(const std::string &text,
                                              const CallOptions &options) {
  if (text.empty()) {
    throw InvalidArgumentError("Cannot embed empty text");
  }
  std::vector<std::vector<float>> vectors;
  try {
    vectors = provider_->embed_batch({text}, options);
  } catch (...) {
    rethrow_as_provider_error(std::current_exception());
  }
  if (vectors.size() != 1) {
    throw EmbeddingProviderError("Provider returned " + std::to_string(vectors.size()) +
                                 " embeddings for a single input");
  }
  return std::move(vectors.front());
}

std::vector<EmbeddingBatch> EmbeddingClient::plan_batches(
    const std::vector<std::string> &texts) const {
  std::vector<EmbeddingBatch> batches;
  size_t batch_start = 0;
  size_t batch_chars = 0;
  for (size_t i = 0; i < texts.size(); ++i) {
    const size_t count = i - batch_start;
    const bool full = count == limits_.max_batch_texts ||
                      (count > 0 && batch_chars + texts[i].size() > limits_.max_batch_chars);
    if (full) {
      batches.push_back({batch_start, count});
      batch_start = i;
      batch_chars = 0;
    }
    batch_chars += texts[i].size();
  }
  if (batch_start < texts.size()) {
    batches.push_back({batch_start, texts.size() - batch_start});
  }
  return batches;
}

std::vector<std::vector<float>> EmbeddingClient::run_batch(const std::vector<std::string> &texts,
                                                           const EmbeddingBatch &batch,
                                                           const CallOptions &options) {
  std::vector<std::string> slice(texts.begin() + batch.offset,
                                 texts.begin() + batch.offset + batch.count);
  std::vector<std::vector<float>> vectors = provider_->embed_batch(slice, options);
  if (vectors.size() != batch.count) {
    throw EmbeddingProviderError("Provider returned " + std::to_string(vectors.size()) +
                                 " embeddings for a batch of " + std::to_string(batch.count));
  }
  return vectors;
}

std::vector<std::vector<float>> EmbeddingClient::embed_many(const std::vector<std::string> &texts,
                                                            const CallOptions &options) {
  std::vector<std::vector<float>> results(texts.size());
  if (texts.empty()) {
    return results;
  }

  const std::vector<EmbeddingBatch> batches = plan_batches(texts);
  std::cout << "[EmbeddingClient] Embedding " << texts.size() << " texts in " << batches.size()
            << " batch(es)" << std::endl;

  for (size_t wave_start = 0; wave_start < batches.size();
       wave_start += limits_.max_concurrent_batches) {
    const size_t wave_end =
        std::min(wave_start + limits_.max_concurrent_batches, batches.size());

    std::vector<std::future<std::vector<std::vector<float>>>> pending;
    pending.reserve(wave_end - wave_start);
    for (size_t b = wave_start; b < wave_end; ++b) {
      pending.push_back(std::async(std::launch::async, [this, &texts, &options, batch = batches[b]] {
        return run_batch(texts, batch, options);
      }));
    }

    // Collect every future of the wave before failing so no request outlives
    // the call.
    std::exception_ptr first_error;
    for (size_t b = wave_start; b < wave_end; ++b) {
      try {
        std::vector<std::vector<float>> vectors = pending[b - wave_start].get();
        const EmbeddingBatch &batch = batches[b];
        for (size_t i = 0; i < batch.count; ++i) {
          results[batch.offset + i] = std::move(vectors[i]);
        }
      } catch (...) {
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
    if (first_error) {
      rethrow_as_provider_error(first_error);
    }
  }

  return results;
}

}  // namespace docchat_core
