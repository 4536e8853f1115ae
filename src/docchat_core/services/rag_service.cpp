#include "docchat_core/services/rag_service.hpp"

#include <iostream>

#include "docchat_core/errors.hpp"

namespace docchat_core {

RagService::RagService(std::shared_ptr<RetrievalPipeline> retrieval,
                       std::shared_ptr<GenerationPipeline> generation)
    : retrieval_(std::move(retrieval)), generation_(std::move(generation)) {
  if (!retrieval_ || !generation_) {
    throw ConfigurationError("RagService requires retrieval and generation pipelines");
  }
}

size_t RagService::ingest(const std::string &document_id,
                          const std::string &text,
                          const CallOptions &options) {
  return retrieval_->ingest(document_id, text, options);
}

TokenStream RagService::retrieve_and_generate(const std::string &system_instructions,
                                              const std::string &user_question,
                                              int k,
                                              const std::string &model,
                                              const CallOptions &options) {
  if (user_question.empty()) {
    throw InvalidArgumentError("User question cannot be empty");
  }

  RetrievalResult results = retrieval_->retrieve(user_question, k, options);
  std::cout << "[RagService] Retrieved " << results.size() << " chunk(s) for question" << std::endl;

  const std::string context = RetrievalPipeline::build_context(results);
  return generation_->generate(system_instructions, context, user_question, model, options);
}

void RagService::delete_document(const std::string &document_id) {
  retrieval_->delete_document(document_id);
}

std::vector<DocumentRecord> RagService::list_documents() const {
  return retrieval_->list_documents();
}

RagStats RagService::stats() const {
  RagStats stats;
  stats.documents = retrieval_->document_count();
  stats.chunks = retrieval_->store().size();
  stats.dimension = retrieval_->store().dimension();
  return stats;
}

}  // namespace docchat_core
