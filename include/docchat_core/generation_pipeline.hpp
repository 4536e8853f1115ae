#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/llm/generation_provider.hpp"
#include "docchat_core/token_stream.hpp"
#include "docchat_core/types/call_options.hpp"

namespace docchat_core {

class GenerationPipeline {
 public:
  GenerationPipeline(std::shared_ptr<GenerationProvider> provider,
                     const std::string &default_model,
                     size_t queue_capacity = 64);
  virtual ~GenerationPipeline() = default;

  GenerationPipeline(const GenerationPipeline &) = delete;
  GenerationPipeline &operator=(const GenerationPipeline &) = delete;

  // Developer message carrying the instructions and any retrieved context,
  // followed by the user's question.
  static std::vector<PromptMessage> build_prompt(const std::string &system_instructions,
                                                 const std::string &context,
                                                 const std::string &user_question);

  // Starts streaming the answer. An empty model selects the default model.
  virtual TokenStream generate(const std::string &system_instructions,
                               const std::string &context,
                               const std::string &user_question,
                               const std::string &model,
                               const CallOptions &options);

  const std::string &default_model() const {
    return default_model_;
  }

 private:
  std::shared_ptr<GenerationProvider> provider_;
  std::string default_model_;
  size_t queue_capacity_;
};

}  // namespace docchat_core
