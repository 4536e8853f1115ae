#include "docchat_api/chat_session.hpp"

#include <iostream>
#include <optional>

#include "docchat_api/routes.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/services/rag_service.hpp"
#include "docchat_core/token_stream.hpp"

namespace docchat_api {

ChatSession::ChatSession(std::shared_ptr<docchat_core::RagService> rag_service,
                         const Config &config,
                         FrameSender send)
    : rag_service_(std::move(rag_service)), config_(config), send_(std::move(send)) {}

ChatSession::~ChatSession() {
  cancel();
  wait();
}

void ChatSession::start(const std::string &message) {
  cancel();
  wait();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
  }
  worker_ = std::thread([this, message] { relay(message); });
}

void ChatSession::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = true;
  if (stream_) {
    stream_->cancel();
  }
}

void ChatSession::wait() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

void ChatSession::attach_stream(docchat_core::TokenStream *stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ = stream;
  if (stream_ && cancelled_) {
    stream_->cancel();
  }
}

// The peer may be gone once cancelled, so nothing is sent after that.
void ChatSession::send_frame(const nlohmann::json &frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return;
  }
  send_(frame.dump());
}

void ChatSession::relay(const std::string &message) {
  try {
    auto json_body = nlohmann::json::parse(message);
    std::string developer_message = json_body.value("developer_message", "");
    std::string user_message = json_body.value("user_message", "");
    std::string model = json_body.value("model", "");
    std::string api_key = json_body.value("api_key", "");
    int top_k = json_body.value("top_k", config_.top_k);

    docchat_core::TokenStream stream = rag_service_->retrieve_and_generate(
        developer_message, user_message, top_k, model, config_.call_options(api_key));
    attach_stream(&stream);

    size_t sent_bytes = 0;
    try {
      while (std::optional<std::string> fragment = stream.next()) {
        sent_bytes += fragment->size();
        send_frame({{"type", "fragment"}, {"content", *fragment}});
      }
    } catch (const std::exception &e) {
      attach_stream(nullptr);
      if (sent_bytes == 0) {
        throw;
      }
      std::cerr << "[ChatSession] Generation failed after " << sent_bytes << " bytes: "
                << e.what() << std::endl;
      send_frame({{"type", "end"},
                  {"status", docchat_core::to_string(docchat_core::StreamEnd::Failed)},
                  {"error", e.what()}});
      return;
    }
    attach_stream(nullptr);
    send_frame({{"type", "end"}, {"status", docchat_core::to_string(stream.end_reason())}});
  } catch (const std::exception &e) {
    std::cerr << "[ChatSession] Exception in relay: " << e.what() << std::endl;
    send_frame({{"type", "error"}, {"error", e.what()}, {"status_code", Routes::status_code_for(e)}});
  }
}

}  // namespace docchat_api
