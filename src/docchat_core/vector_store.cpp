#include "docchat_core/vector_store.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <mutex>

#include "docchat_core/errors.hpp"

namespace docchat_core {

namespace {

double l2_norm(const std::vector<float> &vector) {
  double sum = 0.0;
  for (float value : vector) {
    sum += static_cast<double>(value) * static_cast<double>(value);
  }
  return std::sqrt(sum);
}

double dot(const std::vector<float> &a, const std::vector<float> &b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

// Zero-norm operands score 0 instead of producing NaN.
float score_from(double dot_product, double norm_a, double norm_b) {
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  double score = dot_product / (norm_a * norm_b);
  return static_cast<float>(std::clamp(score, -1.0, 1.0));
}

}  // namespace

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw DimensionMismatchError("Cannot compare vectors of length " + std::to_string(a.size()) +
                                 " and " + std::to_string(b.size()));
  }
  return score_from(dot(a, b), l2_norm(a), l2_norm(b));
}

VectorStore::VectorStore(size_t shard_count) {
  if (shard_count == 0) {
    throw ConfigurationError("VectorStore needs at least one shard");
  }
  shards_.reserve(shard_count);
  for (size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

VectorStore::Shard &VectorStore::shard_for(const std::string &key) {
  return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

const VectorStore::Shard &VectorStore::shard_for(const std::string &key) const {
  return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

void VectorStore::validate_entry(const std::string &key, const std::vector<float> &vector) {
  if (key.empty()) {
    throw InvalidArgumentError("Index entry key cannot be empty");
  }
  if (vector.empty()) {
    throw InvalidArgumentError("Vector for key '" + key + "' is empty");
  }
  for (float value : vector) {
    if (!std::isfinite(value)) {
      throw InvalidArgumentError("Vector for key '" + key + "' contains a non-finite value");
    }
  }
}

void VectorStore::claim_dimension(size_t length) {
  size_t expected = 0;
  if (dimension_.compare_exchange_strong(expected, length)) {
    return;
  }
  if (expected != length) {
    throw DimensionMismatchError("Vector dimension mismatch. Expected " +
                                 std::to_string(expected) + ", got " + std::to_string(length));
  }
}

VectorStore::EntryPtr VectorStore::make_entry(const std::string &key,
                                              const std::vector<float> &vector,
                                              const std::string &text) {
  auto entry = std::make_shared<StoredEntry>();
  entry->key = key;
  entry->vector = vector;
  entry->text = text;
  entry->norm = l2_norm(vector);
  entry->sequence = next_sequence_.fetch_add(1);
  return entry;
}

void VectorStore::store_entry(EntryPtr entry) {
  const std::string key = entry->key;
  Shard &shard = shard_for(key);
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  shard.entries[key] = std::move(entry);
}

void VectorStore::insert(const std::string &key,
                         const std::vector<float> &vector,
                         const std::string &text) {
  validate_entry(key, vector);
  claim_dimension(vector.size());
  store_entry(make_entry(key, vector, text));
}

void VectorStore::insert_batch(const std::vector<IndexEntry> &entries) {
  if (entries.empty()) {
    return;
  }
  const size_t length = entries.front().vector.size();
  for (const IndexEntry &entry : entries) {
    validate_entry(entry.key, entry.vector);
    if (entry.vector.size() != length) {
      throw DimensionMismatchError("Batch mixes vector lengths " + std::to_string(length) +
                                   " and " + std::to_string(entry.vector.size()));
    }
  }
  claim_dimension(length);

  // Nothing below can fail on bad input, so the batch lands whole.
  std::vector<EntryPtr> built;
  built.reserve(entries.size());
  for (const IndexEntry &entry : entries) {
    built.push_back(make_entry(entry.key, entry.vector, entry.text));
  }
  for (EntryPtr &entry : built) {
    store_entry(std::move(entry));
  }
}

RetrievalResult VectorStore::query(const std::vector<float> &query_vector, int k) const {
  if (k <= 0) {
    throw InvalidArgumentError("k must be greater than 0, got " + std::to_string(k));
  }
  const size_t dimension = dimension_.load();
  if (dimension == 0) {
    return {};
  }
  if (query_vector.size() != dimension) {
    throw DimensionMismatchError("Query vector dimension mismatch. Expected " +
                                 std::to_string(dimension) + ", got " +
                                 std::to_string(query_vector.size()));
  }
  for (float value : query_vector) {
    if (!std::isfinite(value)) {
      throw InvalidArgumentError("Query vector contains a non-finite value");
    }
  }

  // Holding the entry pointers keeps them alive after the shard locks drop.
  std::vector<EntryPtr> snapshot;
  for (const auto &shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard->mutex);
    for (const auto &[key, entry] : shard->entries) {
      snapshot.push_back(entry);
    }
  }

  struct Candidate {
    const StoredEntry *entry;
    float score;
  };
  std::vector<Candidate> candidates;
  candidates.reserve(snapshot.size());
  const double query_norm = l2_norm(query_vector);
  for (const EntryPtr &entry : snapshot) {
    candidates.push_back(
        {entry.get(), score_from(dot(query_vector, entry->vector), query_norm, entry->norm)});
  }

  const size_t limit = std::min(static_cast<size_t>(k), candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + limit, candidates.end(),
                    [](const Candidate &a, const Candidate &b) {
                      if (a.score != b.score) {
                        return a.score > b.score;
                      }
                      return a.entry->sequence < b.entry->sequence;
                    });

  RetrievalResult results;
  results.reserve(limit);
  for (size_t i = 0; i < limit; ++i) {
    results.push_back({candidates[i].entry->key, candidates[i].entry->text, candidates[i].score});
  }
  return results;
}

bool VectorStore::remove(const std::string &key) {
  Shard &shard = shard_for(key);
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  return shard.entries.erase(key) > 0;
}

bool VectorStore::contains(const std::string &key) const {
  const Shard &shard = shard_for(key);
  std::shared_lock<std::shared_mutex> lock(shard.mutex);
  return shard.entries.count(key) > 0;
}

size_t VectorStore::size() const {
  size_t total = 0;
  for (const auto &shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard->mutex);
    total += shard->entries.size();
  }
  return total;
}

}  // namespace docchat_core
