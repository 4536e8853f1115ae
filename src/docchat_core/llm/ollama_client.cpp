#include "docchat_core/llm/ollama_client.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "docchat_core/errors.hpp"
#include "ollama.hpp"

namespace docchat_core {

namespace {

int timeout_seconds(const CallOptions &options) {
  auto seconds = std::chrono::ceil<std::chrono::seconds>(options.timeout).count();
  return static_cast<int>(std::max<long long>(1, seconds));
}

// Ollama has no developer role; it takes the instructions as a system message.
std::string ollama_role(const std::string &role) {
  return role == "developer" ? "system" : role;
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  if (!is_server_available()) {
    throw ConfigurationError("Ollama server is not running at " + ollama_url_);
  }
}

bool OllamaClient::is_server_available() {
  Ollama server(ollama_url_);
  return server.is_running();
}

// /api/embed takes an array input, so a whole batch is one request.
std::vector<std::vector<float>> OllamaClient::embed_batch(const std::vector<std::string> &texts,
                                                          const CallOptions &options) {
  if (texts.empty()) {
    return {};
  }
  try {
    Ollama server(ollama_url_);
    server.setReadTimeout(timeout_seconds(options));
    server.setWriteTimeout(timeout_seconds(options));

    ollama::request request = ollama::request::from_embedding(embedding_model_, texts.front());
    request["input"] = texts;
    ollama::response response = server.generate_embeddings(request);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
      throw EmbeddingProviderError("Response does not contain embedding field");
    }
    auto embeddings = json_response["embeddings"].get<std::vector<std::vector<float>>>();
    if (embeddings.size() != texts.size()) {
      throw EmbeddingProviderError("Ollama returned " + std::to_string(embeddings.size()) +
                                   " embeddings for " + std::to_string(texts.size()) +
                                   " inputs");
    }
    return embeddings;
  } catch (const ollama::exception &e) {
    throw EmbeddingProviderError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingProviderError("Malformed embedding response: " + std::string(e.what()));
  }
}

StreamEnd OllamaClient::stream_chat(const ChatRequest &request,
                                    const CallOptions &options,
                                    const StreamHandlers &handlers) {
  ollama::messages messages;
  for (const PromptMessage &message : request.messages) {
    messages.push_back(ollama::message(ollama_role(message.role), message.content));
  }

  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  StreamEnd end = StreamEnd::Completed;

  // ollama-hpp stops reading the stream as soon as the callback returns false.
  auto on_receive = [&](const ollama::response &response) {
    if (handlers.should_stop && handlers.should_stop()) {
      end = StreamEnd::Cancelled;
      return false;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      end = StreamEnd::TimedOut;
      return false;
    }
    const std::string fragment = response.as_simple_string();
    if (!fragment.empty()) {
      handlers.on_fragment(fragment);
    }
    return true;
  };

  try {
    Ollama server(ollama_url_);
    server.setReadTimeout(timeout_seconds(options));
    server.setWriteTimeout(timeout_seconds(options));
    server.chat(request.model, messages, on_receive);
  } catch (const ollama::exception &e) {
    if (end != StreamEnd::Completed) {
      return end;
    }
    // A stalled server surfaces as a read timeout; that ends the answer early.
    if (std::chrono::steady_clock::now() >= deadline) {
      std::cerr << "[OllamaClient] chat stream timed out after " << options.timeout.count()
                << " ms" << std::endl;
      return StreamEnd::TimedOut;
    }
    throw GenerationProviderError("Chat generation failed: " + std::string(e.what()));
  }
  return end;
}

}  // namespace docchat_core
