#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "docchat_core/chunker.hpp"
#include "docchat_core/embedding_client.hpp"
#include "docchat_core/types/call_options.hpp"
#include "docchat_core/vector_store.hpp"

namespace docchat_core {

struct DocumentRecord {
  std::string document_id;
  std::string content_hash;
  size_t chunk_count = 0;
};

/**
 * @class RetrievalPipeline
 * @brief Indexes documents into a VectorStore and retrieves context for queries.
 *
 * Ingestion is atomic per document: chunks are embedded first and committed
 * to the store in one batch, so a failed embedding call leaves the store as
 * it was. Ingests and deletions of the same document id are serialized;
 * different documents proceed concurrently.
 */
class RetrievalPipeline {
 public:
  RetrievalPipeline(std::shared_ptr<VectorStore> store,
                    std::shared_ptr<EmbeddingClient> embedding_client,
                    ChunkingOptions chunking = {});
  virtual ~RetrievalPipeline() = default;

  RetrievalPipeline(const RetrievalPipeline &) = delete;
  RetrievalPipeline &operator=(const RetrievalPipeline &) = delete;

  // Returns the number of chunks indexed for the document. Re-ingesting
  // unchanged text returns the existing count without calling the provider.
  virtual size_t ingest(const std::string &document_id,
                        const std::string &raw_text,
                        const CallOptions &options);

  virtual RetrievalResult retrieve(const std::string &query_text,
                                   int k,
                                   const CallOptions &options);

  // Removes every chunk of the document. Throws NotFoundError for unknown ids.
  virtual size_t delete_document(const std::string &document_id);

  std::vector<DocumentRecord> list_documents() const;
  std::optional<DocumentRecord> find_document(const std::string &document_id) const;
  size_t document_count() const;

  // Joins retrieved passages in score order, one delimited block per source.
  static std::string build_context(const RetrievalResult &results);

  const VectorStore &store() const {
    return *store_;
  }

 private:
  class DocumentGuard;

  std::shared_ptr<VectorStore> store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  ChunkingOptions chunking_;

  mutable std::mutex registry_mutex_;
  std::condition_variable registry_cv_;
  std::map<std::string, DocumentRecord> documents_;
  std::set<std::string> busy_documents_;
};

}  // namespace docchat_core
