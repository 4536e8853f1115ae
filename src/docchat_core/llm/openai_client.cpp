#include "docchat_core/llm/openai_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>

#include "docchat_core/errors.hpp"

namespace docchat_core {

namespace {

// Owns one easy handle and its header list for the duration of a call.
class CurlRequest {
 public:
  CurlRequest() : handle_(curl_easy_init()) {}
  ~CurlRequest() {
    if (headers_) {
      curl_slist_free_all(headers_);
    }
    if (handle_) {
      curl_easy_cleanup(handle_);
    }
  }

  CurlRequest(const CurlRequest &) = delete;
  CurlRequest &operator=(const CurlRequest &) = delete;

  CURL *handle() const {
    return handle_;
  }

  void add_header(const std::string &header) {
    headers_ = curl_slist_append(headers_, header.c_str());
  }

  void prepare_post(const std::string &url, const std::string &body, const CallOptions &options) {
    add_header("Content-Type: application/json");
    add_header("Authorization: Bearer " + options.api_key);
    curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_, CURLOPT_POST, 1L);
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
  }

  long response_code() const {
    long code = 0;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
    return code;
  }

 private:
  CURL *handle_;
  curl_slist *headers_ = nullptr;
};

size_t write_to_string(void *contents, size_t size, size_t nmemb, void *userp) {
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

// Pulls the provider's error message out of an error body when it has one.
std::string describe_error_body(long status, const std::string &body) {
  std::string message = "HTTP " + std::to_string(status);
  try {
    auto json_body = nlohmann::json::parse(body);
    if (json_body.contains("error") && json_body["error"].is_object()) {
      return message + ": " + json_body["error"].value("message", std::string("unknown error"));
    }
  } catch (const nlohmann::json::exception &) {
  }
  return body.empty() ? message : message + ": " + body;
}

struct StreamContext {
  explicit StreamContext(const StreamHandlers &handlers) : handlers(&handlers), decoder(handlers) {}

  CURL *handle = nullptr;
  const StreamHandlers *handlers;
  ChatStreamDecoder decoder;
  std::string error_body;
  bool stopped = false;
  std::exception_ptr error;
};

// Returning anything other than the byte count makes curl abort the transfer.
size_t stream_write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  auto &ctx = *static_cast<StreamContext *>(userp);
  const size_t bytes = size * nmemb;
  std::string_view chunk(static_cast<char *>(contents), bytes);

  long status = 0;
  curl_easy_getinfo(ctx.handle, CURLINFO_RESPONSE_CODE, &status);
  if (status >= 400) {
    ctx.error_body.append(chunk.data(), chunk.size());
    return bytes;
  }
  if (ctx.decoder.done()) {
    return bytes;
  }

  try {
    ctx.decoder.feed(chunk);
  } catch (...) {
    ctx.error = std::current_exception();
    return 0;
  }
  return ctx.decoder.stopped() ? 0 : bytes;
}

// Lets a cancellation abort a transfer that is waiting on the network.
int stream_progress_callback(void *userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto &ctx = *static_cast<StreamContext *>(userp);
  if (ctx.handlers->should_stop && ctx.handlers->should_stop()) {
    ctx.stopped = true;
    return 1;
  }
  return 0;
}

}  // namespace

bool ChatStreamDecoder::feed(std::string_view bytes) {
  if (done_ || stopped_) {
    return false;
  }
  try {
    return parser_.feed(bytes, [this](const std::string &data) { return handle_event(data); });
  } catch (const nlohmann::json::exception &e) {
    throw GenerationProviderError("Malformed chat stream: " + std::string(e.what()));
  }
}

void ChatStreamDecoder::finish() {
  if (done_ || stopped_) {
    return;
  }
  try {
    parser_.finish([this](const std::string &data) { return handle_event(data); });
  } catch (const nlohmann::json::exception &e) {
    throw GenerationProviderError("Malformed chat stream: " + std::string(e.what()));
  }
}

bool ChatStreamDecoder::handle_event(const std::string &data) {
  if (handlers_.should_stop && handlers_.should_stop()) {
    stopped_ = true;
    return false;
  }
  if (data == "[DONE]") {
    done_ = true;
    return false;
  }
  auto event = nlohmann::json::parse(data);
  if (event.contains("error")) {
    throw GenerationProviderError("Provider reported an error mid-stream: " +
                                  event["error"].dump());
  }
  if (!event.contains("choices") || !event["choices"].is_array() || event["choices"].empty()) {
    return true;
  }
  const auto &delta = event["choices"][0].value("delta", nlohmann::json::object());
  if (delta.contains("content") && delta["content"].is_string()) {
    const std::string fragment = delta["content"].get<std::string>();
    if (!fragment.empty()) {
      handlers_.on_fragment(fragment);
    }
  }
  return true;
}

OpenAiClient::OpenAiClient(const std::string &base_url, const std::string &embedding_model)
    : base_url_(base_url), embedding_model_(embedding_model) {
  if (base_url_.empty()) {
    throw ConfigurationError("OpenAI base URL cannot be empty");
  }
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAiClient::~OpenAiClient() {
  curl_global_cleanup();
}

std::string OpenAiClient::endpoint(const std::string &path) const {
  return base_url_ + path;
}

std::vector<std::vector<float>> OpenAiClient::embed_batch(const std::vector<std::string> &texts,
                                                          const CallOptions &options) {
  if (texts.empty()) {
    return {};
  }
  if (options.api_key.empty()) {
    throw InvalidArgumentError("An API key is required for embedding requests");
  }

  nlohmann::json body = {{"model", embedding_model_}, {"input", texts}};
  const std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  CurlRequest request;
  if (!request.handle()) {
    throw EmbeddingProviderError("Failed to initialize CURL");
  }
  std::string response_string;
  request.prepare_post(endpoint("/embeddings"), payload, options);
  curl_easy_setopt(request.handle(), CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(request.handle(), CURLOPT_WRITEDATA, &response_string);

  CURLcode res = curl_easy_perform(request.handle());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw EmbeddingProviderError("Embedding request timed out after " +
                                 std::to_string(options.timeout.count()) + " ms");
  }
  if (res != CURLE_OK) {
    throw EmbeddingProviderError("Embedding request failed: " +
                                 std::string(curl_easy_strerror(res)));
  }
  const long status = request.response_code();
  if (status >= 400) {
    throw EmbeddingProviderError("Embedding request rejected, " +
                                 describe_error_body(status, response_string));
  }

  try {
    auto response_json = nlohmann::json::parse(response_string);
    if (!response_json.contains("data") || !response_json["data"].is_array()) {
      throw EmbeddingProviderError("Response does not contain a data array");
    }
    const auto &data = response_json["data"];
    if (data.size() != texts.size()) {
      throw EmbeddingProviderError("Provider returned " + std::to_string(data.size()) +
                                   " embeddings for " + std::to_string(texts.size()) +
                                   " inputs");
    }

    // Each item names the input it belongs to; do not trust response order.
    std::vector<std::vector<float>> embeddings(texts.size());
    std::vector<bool> filled(texts.size(), false);
    for (size_t i = 0; i < data.size(); ++i) {
      const size_t index = data[i].value("index", i);
      if (index >= texts.size() || filled[index]) {
        throw EmbeddingProviderError("Provider returned an invalid embedding index " +
                                     std::to_string(index));
      }
      embeddings[index] = data[i].at("embedding").get<std::vector<float>>();
      filled[index] = true;
    }
    return embeddings;
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingProviderError("Failed to parse embedding response: " + std::string(e.what()));
  }
}

StreamEnd OpenAiClient::stream_chat(const ChatRequest &chat_request,
                                    const CallOptions &options,
                                    const StreamHandlers &handlers) {
  if (options.api_key.empty()) {
    throw InvalidArgumentError("An API key is required for chat requests");
  }

  nlohmann::json messages = nlohmann::json::array();
  for (const PromptMessage &message : chat_request.messages) {
    messages.push_back({{"role", message.role}, {"content", message.content}});
  }
  nlohmann::json body = {{"model", chat_request.model}, {"messages", messages}, {"stream", true}};
  const std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  CurlRequest request;
  if (!request.handle()) {
    throw GenerationProviderError("Failed to initialize CURL");
  }
  StreamContext ctx(handlers);
  ctx.handle = request.handle();

  request.add_header("Accept: text/event-stream");
  request.prepare_post(endpoint("/chat/completions"), payload, options);
  curl_easy_setopt(request.handle(), CURLOPT_WRITEFUNCTION, stream_write_callback);
  curl_easy_setopt(request.handle(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(request.handle(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(request.handle(), CURLOPT_XFERINFOFUNCTION, stream_progress_callback);
  curl_easy_setopt(request.handle(), CURLOPT_XFERINFODATA, &ctx);

  CURLcode res = curl_easy_perform(request.handle());

  if (ctx.error) {
    try {
      std::rethrow_exception(ctx.error);
    } catch (const GenerationProviderError &) {
      throw;
    } catch (const std::exception &e) {
      throw GenerationProviderError("Malformed chat stream: " + std::string(e.what()));
    }
  }
  if (ctx.stopped || ctx.decoder.stopped()) {
    return StreamEnd::Cancelled;
  }
  if (res == CURLE_OPERATION_TIMEDOUT) {
    std::cerr << "[OpenAiClient] chat stream timed out after " << options.timeout.count()
              << " ms" << std::endl;
    return StreamEnd::TimedOut;
  }
  if (res != CURLE_OK) {
    throw GenerationProviderError("Chat request failed: " + std::string(curl_easy_strerror(res)));
  }
  const long status = request.response_code();
  if (status >= 400) {
    throw GenerationProviderError("Chat request rejected, " +
                                  describe_error_body(status, ctx.error_body));
  }

  ctx.decoder.finish();
  return ctx.decoder.stopped() ? StreamEnd::Cancelled : StreamEnd::Completed;
}

}  // namespace docchat_core
