#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "config.hpp"

// Forward declarations
namespace docchat_core {
class RagService;
class TokenStream;
}  // namespace docchat_core

namespace docchat_api {

/**
 * @class ChatSession
 * @brief Relays one streamed answer per chat message to a websocket peer.
 *
 * Each message is a JSON object with the same fields as POST /api/chat. The
 * answer goes out as it is generated, one frame per fragment:
 *
 *   {"type":"fragment","content":"..."}
 *   {"type":"end","status":"completed|cancelled|timed_out|failed"}
 *   {"type":"error","error":"...","status_code":400}
 *
 * An error before any text produces a single error frame. A failure after
 * some text produces an end frame with status "failed" and the error message.
 * After cancel() the peer receives nothing more.
 */
class ChatSession {
 public:
  using FrameSender = std::function<void(const std::string &frame)>;

  ChatSession(std::shared_ptr<docchat_core::RagService> rag_service,
              const Config &config,
              FrameSender send);
  ~ChatSession();

  ChatSession(const ChatSession &) = delete;
  ChatSession &operator=(const ChatSession &) = delete;

  // Cancels any answer still relaying, then starts answering this message
  void start(const std::string &message);

  // Stops the running answer; the provider is told to stop and no further
  // frames are sent
  void cancel();

  // Blocks until the current relay has finished
  void wait();

 private:
  void relay(const std::string &message);
  void attach_stream(docchat_core::TokenStream *stream);
  void send_frame(const nlohmann::json &frame);

  std::shared_ptr<docchat_core::RagService> rag_service_;
  Config config_;
  FrameSender send_;

  std::mutex mutex_;
  bool cancelled_ = false;
  docchat_core::TokenStream *stream_ = nullptr;  // Owned by the relay thread
  std::thread worker_;
};

}  // namespace docchat_api
