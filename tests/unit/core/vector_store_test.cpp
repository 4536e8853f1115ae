#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

#include "docchat_core/errors.hpp"
#include "docchat_core/vector_store.hpp"
#include "../../common/utilities_test.hpp"

namespace docchat_core {

using docchat_tests::TestUtilities;

class VectorStoreTest : public ::testing::Test {
 protected:
  VectorStore store_;
};

TEST_F(VectorStoreTest, EmptyStoreReturnsEmptyResult) {
  EXPECT_TRUE(store_.query({1.0f, 0.0f}, 3).empty());
  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(store_.dimension(), 0u);
}

TEST_F(VectorStoreTest, RejectsNonPositiveK) {
  EXPECT_THROW(store_.query({1.0f}, 0), InvalidArgumentError);
  store_.insert("a", {1.0f}, "a");
  EXPECT_THROW(store_.query({1.0f}, -1), InvalidArgumentError);
}

TEST_F(VectorStoreTest, FirstInsertFixesDimension) {
  store_.insert("a", {1.0f, 0.0f, 0.0f}, "a");
  EXPECT_EQ(store_.dimension(), 3u);

  EXPECT_THROW(store_.insert("b", {1.0f, 0.0f}, "b"), DimensionMismatchError);
  EXPECT_FALSE(store_.contains("b"));
  EXPECT_EQ(store_.size(), 1u);
}

TEST_F(VectorStoreTest, QueryWithDifferentDimensionThrows) {
  store_.insert("a", {1.0f, 0.0f, 0.0f}, "a");
  EXPECT_THROW(store_.query({1.0f, 0.0f}, 1), DimensionMismatchError);
  EXPECT_THROW(store_.query({1.0f, 0.0f, 0.0f, 0.0f}, 1), DimensionMismatchError);
}

TEST_F(VectorStoreTest, RejectsInvalidEntries) {
  EXPECT_THROW(store_.insert("", {1.0f}, "text"), InvalidArgumentError);
  EXPECT_THROW(store_.insert("a", {}, "text"), InvalidArgumentError);
  EXPECT_THROW(store_.insert("a", {NAN, 1.0f}, "text"), InvalidArgumentError);
  EXPECT_EQ(store_.dimension(), 0u);
}

TEST_F(VectorStoreTest, ReinsertReplacesEntry) {
  store_.insert("a", {1.0f, 0.0f}, "old");
  store_.insert("a", {0.0f, 1.0f}, "new");

  EXPECT_EQ(store_.size(), 1u);
  auto results = store_.query({0.0f, 1.0f}, 5);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].key, "a");
  EXPECT_EQ(results[0].text, "new");
  EXPECT_FLOAT_EQ(results[0].score, 1.0f);
}

TEST_F(VectorStoreTest, ResultsAreSortedAndBoundedByK) {
  store_.insert("far", {-1.0f, 0.0f}, "far");
  store_.insert("near", {0.9f, 0.1f}, "near");
  store_.insert("exact", {1.0f, 0.0f}, "exact");
  store_.insert("orthogonal", {0.0f, 1.0f}, "orthogonal");
  store_.insert("close", {0.6f, 0.4f}, "close");

  auto top3 = store_.query({1.0f, 0.0f}, 3);
  EXPECT_EQ(TestUtilities::keys_of(top3), (std::vector<std::string>{"exact", "near", "close"}));

  auto all = store_.query({1.0f, 0.0f}, 10);
  ASSERT_EQ(all.size(), 5u);
  for (size_t i = 1; i < all.size(); ++i) {
    EXPECT_GE(all[i - 1].score, all[i].score);
  }
  EXPECT_EQ(all.back().key, "far");
  EXPECT_FLOAT_EQ(all.back().score, -1.0f);
}

TEST_F(VectorStoreTest, TiesGoToEarlierInsertion) {
  store_.insert("second-key", {1.0f, 1.0f}, "x");
  store_.insert("first-key", {2.0f, 2.0f}, "y");
  store_.insert("third-key", {3.0f, 3.0f}, "z");

  auto results = store_.query({1.0f, 1.0f}, 3);
  EXPECT_EQ(TestUtilities::keys_of(results),
            (std::vector<std::string>{"second-key", "first-key", "third-key"}));
}

TEST_F(VectorStoreTest, ZeroVectorsScoreZero) {
  store_.insert("zero", {0.0f, 0.0f, 0.0f}, "zero");
  store_.insert("axis", {1.0f, 0.0f, 0.0f}, "axis");

  auto results = store_.query({1.0f, 0.0f, 0.0f}, 2);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].key, "zero");
  EXPECT_EQ(results[1].score, 0.0f);

  auto zero_query = store_.query({0.0f, 0.0f, 0.0f}, 2);
  for (const auto& result : zero_query) {
    EXPECT_EQ(result.score, 0.0f);
    EXPECT_FALSE(std::isnan(result.score));
  }
}

TEST_F(VectorStoreTest, QueryRejectsNonFiniteValues) {
  store_.insert("a", {1.0f, 0.0f}, "a");
  store_.insert("b", {0.0f, 1.0f}, "b");

  EXPECT_THROW(store_.query({NAN, 1.0f}, 2), InvalidArgumentError);
  EXPECT_THROW(store_.query({1.0f, INFINITY}, 2), InvalidArgumentError);
}

TEST_F(VectorStoreTest, RemoveReportsWhetherKeyExisted) {
  store_.insert("a", {1.0f}, "a");

  EXPECT_TRUE(store_.remove("a"));
  EXPECT_FALSE(store_.remove("a"));
  EXPECT_FALSE(store_.contains("a"));
  EXPECT_TRUE(store_.query({1.0f}, 1).empty());
}

TEST_F(VectorStoreTest, InsertBatchIsAllOrNothing) {
  std::vector<IndexEntry> entries = {
      {"doc:0", {1.0f, 0.0f}, "zero"},
      {"doc:1", {0.0f, 1.0f}, "one"},
      {"doc:2", {1.0f, 0.0f, 0.0f}, "bad"},
  };

  EXPECT_THROW(store_.insert_batch(entries), DimensionMismatchError);
  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(store_.dimension(), 0u);

  entries.pop_back();
  store_.insert_batch(entries);
  EXPECT_EQ(store_.size(), 2u);
  EXPECT_EQ(store_.dimension(), 2u);
}

TEST_F(VectorStoreTest, InsertBatchAgainstFixedDimension) {
  store_.insert("existing", {1.0f, 0.0f}, "existing");

  std::vector<IndexEntry> entries = {{"doc:0", {1.0f, 0.0f, 0.0f}, "wrong"}};
  EXPECT_THROW(store_.insert_batch(entries), DimensionMismatchError);
  EXPECT_EQ(store_.size(), 1u);
}

TEST(CosineSimilarityTest, KnownValues) {
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f, 0.0f}, {1.0f, 0.0f}), 1.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f, 0.0f}, {-2.0f, 0.0f}), -1.0f);
  EXPECT_EQ(cosine_similarity({0.0f, 0.0f}, {1.0f, 1.0f}), 0.0f);
  EXPECT_THROW(cosine_similarity({1.0f}, {1.0f, 0.0f}), DimensionMismatchError);
}

// Each key's text encodes the value written with it, so a reader can check
// that the score it saw was computed from the vector stored with that text.
TEST_F(VectorStoreTest, ConcurrentReadersSeeConsistentEntries) {
  constexpr int kKeys = 32;
  constexpr int kWritesPerKey = 50;
  for (int i = 0; i < kKeys; ++i) {
    store_.insert("k" + std::to_string(i), {1.0f, 1.0f}, "1");
  }

  std::atomic<bool> done{false};
  std::atomic<int> inconsistencies{0};

  std::vector<std::thread> writers;
  for (int w = 0; w < 4; ++w) {
    writers.emplace_back([this, w] {
      for (int round = 1; round <= kWritesPerKey; ++round) {
        for (int i = w; i < kKeys; i += 4) {
          float value = static_cast<float>(round);
          store_.insert("k" + std::to_string(i), {value, 1.0f}, std::to_string(round));
        }
      }
    });
  }

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([this, &done, &inconsistencies] {
      while (!done.load()) {
        for (const auto& result : store_.query({1.0f, 0.0f}, kKeys)) {
          double value = std::stod(result.text);
          double expected = value / std::sqrt(value * value + 1.0);
          if (std::abs(expected - result.score) > 1e-4) {
            ++inconsistencies;
          }
        }
      }
    });
  }

  for (auto& writer : writers) {
    writer.join();
  }
  done.store(true);
  for (auto& reader : readers) {
    reader.join();
  }

  EXPECT_EQ(inconsistencies.load(), 0);
  EXPECT_EQ(store_.size(), static_cast<size_t>(kKeys));
  auto results = store_.query({1.0f, 0.0f}, kKeys);
  for (const auto& result : results) {
    EXPECT_EQ(result.text, std::to_string(kWritesPerKey));
  }
}

TEST_F(VectorStoreTest, ConstructorRejectsZeroShards) {
  EXPECT_THROW(VectorStore(0), ConfigurationError);
}

}  // namespace docchat_core
