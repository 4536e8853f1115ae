#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace docchat_core {

struct IndexEntry {
  std::string key;
  std::vector<float> vector;
  std::string text;
};

struct ScoredChunk {
  std::string key;
  std::string text;
  float score;
};

// Sorted by descending score.
using RetrievalResult = std::vector<ScoredChunk>;

/**
 * @class VectorStore
 * @brief In-memory keyed vector index with exhaustive cosine-similarity search.
 *
 * Entries are immutable once built; replacing a key swaps the whole entry
 * under the shard lock, so a concurrent query observes either the old or the
 * new (vector, text) pair and never a mix of the two. Keys are spread over
 * shards that each carry their own reader/writer lock: queries run in
 * parallel with each other, and writers to different shards never contend.
 *
 * The store's dimensionality is fixed by the first successful insertion.
 */
class VectorStore {
 public:
  explicit VectorStore(size_t shard_count = 16);
  ~VectorStore() = default;

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;
  VectorStore(VectorStore &&) = delete;
  VectorStore &operator=(VectorStore &&) = delete;

  // Inserts or replaces the entry stored under key.
  void insert(const std::string &key, const std::vector<float> &vector, const std::string &text);

  // Validates every entry before touching the index, then inserts them in
  // order. Either all entries are stored or none.
  void insert_batch(const std::vector<IndexEntry> &entries);

  RetrievalResult query(const std::vector<float> &query_vector, int k) const;

  bool remove(const std::string &key);

  bool contains(const std::string &key) const;

  size_t size() const;

  // 0 until the first successful insertion.
  size_t dimension() const {
    return dimension_.load();
  }

 private:
  struct StoredEntry {
    std::string key;
    std::vector<float> vector;
    std::string text;
    double norm;
    uint64_t sequence;
  };
  using EntryPtr = std::shared_ptr<const StoredEntry>;

  struct Shard {
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, EntryPtr> entries;
  };

  Shard &shard_for(const std::string &key);
  const Shard &shard_for(const std::string &key) const;

  static void validate_entry(const std::string &key, const std::vector<float> &vector);
  void claim_dimension(size_t length);
  EntryPtr make_entry(const std::string &key, const std::vector<float> &vector,
                      const std::string &text);
  void store_entry(EntryPtr entry);

  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<size_t> dimension_{0};
  std::atomic<uint64_t> next_sequence_{0};
};

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

}  // namespace docchat_core
