#include "docchat_core/retrieval_pipeline.hpp"

#include <iostream>
#include <sstream>

#include "docchat_core/content_hash.hpp"
#include "docchat_core/errors.hpp"

namespace docchat_core {

// Holds exclusive ownership of one document id for the guard's lifetime.
class RetrievalPipeline::DocumentGuard {
 public:
  DocumentGuard(RetrievalPipeline &pipeline, const std::string &document_id)
      : pipeline_(pipeline), document_id_(document_id) {
    std::unique_lock<std::mutex> lock(pipeline_.registry_mutex_);
    pipeline_.registry_cv_.wait(
        lock, [this] { return pipeline_.busy_documents_.count(document_id_) == 0; });
    pipeline_.busy_documents_.insert(document_id_);
  }

  ~DocumentGuard() {
    {
      std::lock_guard<std::mutex> lock(pipeline_.registry_mutex_);
      pipeline_.busy_documents_.erase(document_id_);
    }
    pipeline_.registry_cv_.notify_all();
  }

  DocumentGuard(const DocumentGuard &) = delete;
  DocumentGuard &operator=(const DocumentGuard &) = delete;

 private:
  RetrievalPipeline &pipeline_;
  std::string document_id_;
};

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<VectorStore> store,
                                     std::shared_ptr<EmbeddingClient> embedding_client,
                                     ChunkingOptions chunking)
    : store_(std::move(store)),
      embedding_client_(std::move(embedding_client)),
      chunking_(chunking) {
  if (!store_ || !embedding_client_) {
    throw ConfigurationError("RetrievalPipeline requires a vector store and an embedding client");
  }
  TextChunker::validate(chunking_.chunk_size, chunking_.overlap);
}

size_t RetrievalPipeline::ingest(const std::string &document_id,
                                 const std::string &raw_text,
                                 const CallOptions &options) {
  if (document_id.empty()) {
    throw InvalidArgumentError("document_id cannot be empty");
  }

  DocumentGuard guard(*this, document_id);
  const std::string content_hash = sha256_hex(raw_text);

  size_t previous_count = 0;
  if (auto existing = find_document(document_id)) {
    if (existing->content_hash == content_hash) {
      std::cout << "[RetrievalPipeline] Document '" << document_id
                << "' is unchanged, keeping " << existing->chunk_count << " chunks" << std::endl;
      return existing->chunk_count;
    }
    previous_count = existing->chunk_count;
  }

  std::vector<Chunk> chunks = TextChunker::chunk(document_id, raw_text, chunking_);

  if (!chunks.empty()) {
    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const Chunk &chunk : chunks) {
      texts.push_back(chunk.text);
    }

    // Any failure up to here leaves the store untouched.
    std::vector<std::vector<float>> vectors = embedding_client_->embed_many(texts, options);

    std::vector<IndexEntry> entries;
    entries.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
      entries.push_back({chunks[i].key, std::move(vectors[i]), chunks[i].text});
    }
    store_->insert_batch(entries);
  }

  // A shorter new version leaves higher ordinals of the old one behind.
  for (size_t ordinal = chunks.size(); ordinal < previous_count; ++ordinal) {
    store_->remove(make_chunk_key(document_id, static_cast<int>(ordinal)));
  }

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    documents_[document_id] = {document_id, content_hash, chunks.size()};
  }

  std::cout << "[RetrievalPipeline] Indexed document '" << document_id << "' as " << chunks.size()
            << " chunks" << std::endl;
  return chunks.size();
}

RetrievalResult RetrievalPipeline::retrieve(const std::string &query_text,
                                            int k,
                                            const CallOptions &options) {
  if (query_text.empty()) {
    throw InvalidArgumentError("Query text cannot be empty");
  }
  if (k <= 0) {
    throw InvalidArgumentError("k must be greater than 0, got " + std::to_string(k));
  }
  // Nothing to search; skip the embedding round-trip.
  if (store_->size() == 0) {
    return {};
  }

  std::vector<float> query_vector = embedding_client_->embed_one(query_text, options);
  return store_->query(query_vector, k);
}

size_t RetrievalPipeline::delete_document(const std::string &document_id) {
  if (document_id.empty()) {
    throw InvalidArgumentError("document_id cannot be empty");
  }

  DocumentGuard guard(*this, document_id);
  std::optional<DocumentRecord> record = find_document(document_id);
  if (!record) {
    throw NotFoundError("Document not found: " + document_id);
  }

  size_t removed = 0;
  for (size_t ordinal = 0; ordinal < record->chunk_count; ++ordinal) {
    if (store_->remove(make_chunk_key(document_id, static_cast<int>(ordinal)))) {
      ++removed;
    }
  }

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    documents_.erase(document_id);
  }
  std::cout << "[RetrievalPipeline] Deleted document '" << document_id << "' (" << removed
            << " chunks)" << std::endl;
  return removed;
}

std::vector<DocumentRecord> RetrievalPipeline::list_documents() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<DocumentRecord> records;
  records.reserve(documents_.size());
  for (const auto &[id, record] : documents_) {
    records.push_back(record);
  }
  return records;
}

std::optional<DocumentRecord> RetrievalPipeline::find_document(
    const std::string &document_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t RetrievalPipeline::document_count() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return documents_.size();
}

std::string RetrievalPipeline::build_context(const RetrievalResult &results) {
  std::stringstream context;
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      context << "\n\n---\n\n";
    }
    context << "[Source " << (i + 1) << ": " << results[i].key << "]\n" << results[i].text;
  }
  return context.str();
}

}  // namespace docchat_core
