#include "docchat_core/generation_pipeline.hpp"

#include <iostream>

#include "docchat_core/errors.hpp"

namespace docchat_core {

GenerationPipeline::GenerationPipeline(std::shared_ptr<GenerationProvider> provider,
                                       const std::string &default_model,
                                       size_t queue_capacity)
    : provider_(std::move(provider)), default_model_(default_model), queue_capacity_(queue_capacity) {
  if (!provider_) {
    throw ConfigurationError("GenerationPipeline requires a provider");
  }
  if (default_model_.empty()) {
    throw ConfigurationError("GenerationPipeline requires a default model");
  }
}

std::vector<PromptMessage> GenerationPipeline::build_prompt(const std::string &system_instructions,
                                                            const std::string &context,
                                                            const std::string &user_question) {
  std::string developer_message = system_instructions;
  if (!context.empty()) {
    developer_message += "\n\nRelevant context from uploaded documents:\n" + context +
                         "\n\nPlease use this context to answer the user's question when relevant.";
  }
  return {{"developer", developer_message}, {"user", user_question}};
}

TokenStream GenerationPipeline::generate(const std::string &system_instructions,
                                         const std::string &context,
                                         const std::string &user_question,
                                         const std::string &model,
                                         const CallOptions &options) {
  if (user_question.empty()) {
    throw InvalidArgumentError("User question cannot be empty");
  }

  ChatRequest request;
  request.model = model.empty() ? default_model_ : model;
  request.messages = build_prompt(system_instructions, context, user_question);

  std::cout << "[GenerationPipeline] Streaming answer with model " << request.model
            << " (context " << context.size() << " chars)" << std::endl;

  return TokenStream::start(
      [provider = provider_, request, options](const StreamHandlers &handlers) {
        return provider->stream_chat(request, options, handlers);
      },
      queue_capacity_);
}

}  // namespace docchat_core
