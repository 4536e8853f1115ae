#pragma once

#include <functional>
#include <string>
#include <vector>

#include "docchat_core/types/call_options.hpp"

namespace docchat_core {

struct PromptMessage {
  std::string role;
  std::string content;
};

struct ChatRequest {
  std::string model;
  std::vector<PromptMessage> messages;
};

enum class StreamEnd { Completed, Cancelled, TimedOut, Failed };

inline std::string to_string(StreamEnd end) {
  switch (end) {
    case StreamEnd::Completed:
      return "completed";
    case StreamEnd::Cancelled:
      return "cancelled";
    case StreamEnd::TimedOut:
      return "timed_out";
    case StreamEnd::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

struct StreamHandlers {
  // Receives each text fragment as soon as the provider produces it.
  std::function<void(const std::string &fragment)> on_fragment;
  // Polled while the transfer runs; returning true aborts it.
  std::function<bool()> should_stop;
};

class GenerationProvider {
 public:
  virtual ~GenerationProvider() = default;

  /**
   * @brief Runs a streaming chat completion, blocking until it ends.
   *
   * @return Completed when the provider finished the answer, Cancelled when
   *         should_stop() ended it, TimedOut when options.timeout elapsed.
   * @throws GenerationProviderError on transport or provider failure.
   */
  virtual StreamEnd stream_chat(const ChatRequest &request,
                                const CallOptions &options,
                                const StreamHandlers &handlers) = 0;
};

}  // namespace docchat_core
