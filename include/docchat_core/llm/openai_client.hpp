#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "docchat_core/llm/embedding_provider.hpp"
#include "docchat_core/llm/generation_provider.hpp"
#include "docchat_core/llm/sse_parser.hpp"

namespace docchat_core {

/**
 * @class ChatStreamDecoder
 * @brief Turns the event-stream body of a streamed chat completion into fragments.
 *
 * Each event carries a JSON chunk whose `choices[0].delta.content` is the
 * next fragment; `[DONE]` ends the answer. should_stop() is checked before
 * every event, so nothing is forwarded once the caller asked to stop.
 */
class ChatStreamDecoder {
 public:
  explicit ChatStreamDecoder(const StreamHandlers &handlers) : handlers_(handlers) {}

  /**
   * @return false once the answer is done or the caller asked to stop.
   * @throws GenerationProviderError for an error event or a malformed chunk.
   */
  bool feed(std::string_view bytes);

  // Handles an event left unterminated when the body ended.
  void finish();

  bool done() const {
    return done_;
  }

  bool stopped() const {
    return stopped_;
  }

 private:
  bool handle_event(const std::string &data);

  const StreamHandlers &handlers_;
  SseParser parser_;
  bool done_ = false;
  bool stopped_ = false;
};

/**
 * @class OpenAiClient
 * @brief Embedding and streaming chat provider for OpenAI-compatible APIs.
 *
 * Every call opens its own curl handle, so concurrent batches and streams
 * never share connection state. The bearer token is taken from the
 * CallOptions of each call.
 */
class OpenAiClient : public EmbeddingProvider, public GenerationProvider {
 public:
  OpenAiClient(const std::string &base_url, const std::string &embedding_model);
  ~OpenAiClient() override;

  OpenAiClient(const OpenAiClient &) = delete;
  OpenAiClient &operator=(const OpenAiClient &) = delete;

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts,
                                              const CallOptions &options) override;

  StreamEnd stream_chat(const ChatRequest &request,
                        const CallOptions &options,
                        const StreamHandlers &handlers) override;

  const std::string &base_url() const {
    return base_url_;
  }

 private:
  std::string endpoint(const std::string &path) const;

  std::string base_url_;
  std::string embedding_model_;
};

}  // namespace docchat_core
