#pragma once

#include <memory>
#include <string>

#include "docchat_core/llm/embedding_provider.hpp"
#include "docchat_core/llm/generation_provider.hpp"

namespace docchat_core {

struct ProviderSettings {
  std::string provider;  // "openai" or "ollama"
  std::string url;
  std::string embedding_model;
};

struct Providers {
  std::shared_ptr<EmbeddingProvider> embedding;
  std::shared_ptr<GenerationProvider> generation;
};

// Throws ConfigurationError for an unknown provider name.
Providers make_providers(const ProviderSettings &settings);

}  // namespace docchat_core
