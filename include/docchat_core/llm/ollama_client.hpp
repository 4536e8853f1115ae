#pragma once

#include <string>
#include <vector>

#include "docchat_core/llm/embedding_provider.hpp"
#include "docchat_core/llm/generation_provider.hpp"

namespace docchat_core {

// Local provider backed by an Ollama server. Ollama has no credentials, so
// the api_key of CallOptions is ignored.
class OllamaClient : public EmbeddingProvider, public GenerationProvider {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts,
                                              const CallOptions &options) override;

  StreamEnd stream_chat(const ChatRequest &request,
                        const CallOptions &options,
                        const StreamHandlers &handlers) override;

  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
};

}  // namespace docchat_core
