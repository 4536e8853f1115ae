#include "docchat_core/llm/provider_factory.hpp"

#include "docchat_core/errors.hpp"
#include "docchat_core/llm/ollama_client.hpp"
#include "docchat_core/llm/openai_client.hpp"

namespace docchat_core {

Providers make_providers(const ProviderSettings &settings) {
  if (settings.provider == "openai") {
    auto client = std::make_shared<OpenAiClient>(settings.url, settings.embedding_model);
    return {client, client};
  }
  if (settings.provider == "ollama") {
    auto client = std::make_shared<OllamaClient>(settings.url, settings.embedding_model);
    return {client, client};
  }
  throw ConfigurationError("Unknown provider '" + settings.provider +
                           "', expected 'openai' or 'ollama'");
}

}  // namespace docchat_core
