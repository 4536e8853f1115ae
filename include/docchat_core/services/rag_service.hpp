#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/generation_pipeline.hpp"
#include "docchat_core/retrieval_pipeline.hpp"
#include "docchat_core/token_stream.hpp"
#include "docchat_core/types/call_options.hpp"

namespace docchat_core {

struct RagStats {
  size_t documents = 0;
  size_t chunks = 0;
  size_t dimension = 0;
};

// The narrow surface the HTTP layer talks to.
class RagService {
 public:
  RagService(std::shared_ptr<RetrievalPipeline> retrieval,
             std::shared_ptr<GenerationPipeline> generation);
  virtual ~RagService() = default;

  virtual size_t ingest(const std::string &document_id,
                        const std::string &text,
                        const CallOptions &options);

  // Retrieves the k most relevant chunks for the question and streams an
  // answer conditioned on them. With an empty index the answer is generated
  // without context.
  virtual TokenStream retrieve_and_generate(const std::string &system_instructions,
                                            const std::string &user_question,
                                            int k,
                                            const std::string &model,
                                            const CallOptions &options);

  virtual void delete_document(const std::string &document_id);

  std::vector<DocumentRecord> list_documents() const;

  RagStats stats() const;

 private:
  std::shared_ptr<RetrievalPipeline> retrieval_;
  std::shared_ptr<GenerationPipeline> generation_;
};

}  // namespace docchat_core
