#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "docchat_core/llm/generation_provider.hpp"

namespace docchat_core {

/**
 * @class TokenStream
 * @brief Lazy, finite, non-restartable sequence of generated text fragments.
 *
 * A producer thread runs the provider call and feeds a bounded queue; the
 * consumer pulls fragments with next(). When the queue is full the producer
 * waits, so a slow consumer applies backpressure to the provider.
 *
 * cancel() tells the provider to stop, discards anything still queued, and
 * makes next() return std::nullopt from then on. Destroying a stream
 * cancels it and joins the producer.
 */
class TokenStream {
 public:
  using Producer = std::function<StreamEnd(const StreamHandlers &handlers)>;

  static TokenStream start(Producer producer, size_t queue_capacity = 64);

  TokenStream(TokenStream &&other) noexcept = default;
  TokenStream &operator=(TokenStream &&) = delete;
  TokenStream(const TokenStream &) = delete;
  TokenStream &operator=(const TokenStream &) = delete;
  ~TokenStream();

  /**
   * @brief Blocks until the next fragment is available.
   *
   * @return The fragment, or std::nullopt once the stream has ended or was
   *         cancelled.
   * @throws GenerationProviderError if the provider failed. Every fragment
   *         produced before the failure is returned first; after the error
   *         has been thrown once, next() returns std::nullopt.
   */
  std::optional<std::string> next();

  void cancel();

  // Final state; meaningful once next() has returned std::nullopt or thrown.
  StreamEnd end_reason() const;

 private:
  struct State;

  TokenStream(std::shared_ptr<State> state, std::thread producer);

  std::shared_ptr<State> state_;
  std::thread producer_;
};

}  // namespace docchat_core
