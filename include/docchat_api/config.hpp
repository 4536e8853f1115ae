#pragma once

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "docchat_core/chunker.hpp"
#include "docchat_core/embedding_client.hpp"
#include "docchat_core/llm/provider_factory.hpp"
#include "docchat_core/types/call_options.hpp"

class Config {
 public:
  std::string api_base_url;
  int num_threads;

  // Model provider
  std::string provider;
  std::string provider_url;
  std::string embedding_model;
  std::string chat_model;
  // Used only when a request carries no key of its own
  std::string api_key;
  int request_timeout_ms;

  // Indexing and retrieval
  int chunk_size;
  int chunk_overlap;
  int top_k;
  int embedding_batch_size;
  int embedding_batch_max_chars;
  int embedding_max_concurrency;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
    config.provider = json_config.value("provider", std::string("openai"));
    config.provider_url = json_config.value("provider_url", default_provider_url(config.provider));
    config.embedding_model = json_config.value("embedding_model", std::string("text-embedding-3-small"));
    config.chat_model = json_config.value("chat_model", std::string("gpt-4.1-mini"));
    config.api_key = json_config.value("api_key", std::string(""));

    config.num_threads = int_or_default(json_config, "num_threads", 4);
    config.request_timeout_ms = int_or_default(json_config, "request_timeout_ms", 60000);
    config.chunk_size = int_or_default(json_config, "chunk_size", 1000);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 200);
    config.top_k = int_or_default(json_config, "top_k", 3);
    config.embedding_batch_size = int_or_default(json_config, "embedding_batch_size", 64);
    config.embedding_batch_max_chars = int_or_default(json_config, "embedding_batch_max_chars", 100000);
    config.embedding_max_concurrency = int_or_default(json_config, "embedding_max_concurrency", 4);

    config.validate();
    return config;
  }

  docchat_core::ProviderSettings provider_settings() const {
    return {provider, provider_url, embedding_model};
  }

  docchat_core::ChunkingOptions chunking() const {
    return {chunk_size, chunk_overlap};
  }

  docchat_core::EmbeddingBatchLimits embedding_limits() const {
    return {static_cast<size_t>(embedding_batch_size),
            static_cast<size_t>(embedding_batch_max_chars),
            static_cast<size_t>(embedding_max_concurrency)};
  }

  // Per-request options; the request's own key wins over the configured one.
  docchat_core::CallOptions call_options(const std::string& request_api_key) const {
    docchat_core::CallOptions options;
    options.api_key = request_api_key.empty() ? api_key : request_api_key;
    options.timeout = std::chrono::milliseconds(request_timeout_ms);
    return options;
  }

 private:
  static std::string default_provider_url(const std::string& provider_name) {
    if (provider_name == "ollama") {
      return "http://localhost:11434";
    }
    return "https://api.openai.com/v1";
  }

  // Handle integer with default and basic type safety
  static int int_or_default(const nlohmann::json& json_config, const std::string& key, int fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<int>();
      }
    } catch (const std::exception&) {
      // Fallback to default if wrong type provided
    }
    return fallback;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (provider != "openai" && provider != "ollama") {
      throw std::runtime_error("provider must be 'openai' or 'ollama'");
    }
    if (provider_url.empty()) {
      throw std::runtime_error("provider_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (chat_model.empty()) {
      throw std::runtime_error("chat_model cannot be empty");
    }
    if (num_threads <= 0) {
      throw std::runtime_error("num_threads must be greater than 0");
    }
    if (request_timeout_ms < 100) {
      throw std::runtime_error("request_timeout_ms must be at least 100ms");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be non-negative and smaller than chunk_size");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (embedding_batch_size <= 0 || embedding_batch_max_chars <= 0 || embedding_max_concurrency <= 0) {
      throw std::runtime_error("embedding batch limits must be greater than 0");
    }
  }
};
