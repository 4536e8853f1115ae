#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <unistd.h>

#include "docchat_api/config.hpp"

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/docchat_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"provider", "ollama"},
      {"embedding_model", "nomic-embed-text"},
      {"chat_model", "llama3"},
      {"chunk_size", 500},
      {"chunk_overlap", 50},
      {"top_k", 5}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.provider, "ollama");
  EXPECT_EQ(cfg.provider_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.chat_model, "llama3");
  EXPECT_EQ(cfg.chunking().chunk_size, 500);
  EXPECT_EQ(cfg.chunking().overlap, 50);
  EXPECT_EQ(cfg.top_k, 5);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:8000");
  EXPECT_EQ(cfg.provider, "openai");
  EXPECT_EQ(cfg.provider_url, "https://api.openai.com/v1");
  EXPECT_EQ(cfg.embedding_model, "text-embedding-3-small");
  EXPECT_EQ(cfg.chat_model, "gpt-4.1-mini");
  EXPECT_EQ(cfg.num_threads, 4);
  EXPECT_EQ(cfg.chunk_size, 1000);
  EXPECT_EQ(cfg.chunk_overlap, 200);
  EXPECT_EQ(cfg.top_k, 3);
  EXPECT_EQ(cfg.embedding_limits().max_batch_texts, 64u);
  EXPECT_EQ(cfg.embedding_limits().max_batch_chars, 100000u);
  EXPECT_EQ(cfg.embedding_limits().max_concurrent_batches, 4u);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "provider": "openai",
    "provider_url": "http://localhost:9000/v1",
    "request_timeout_ms": 15000,
    "num_threads": 2
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.provider_url, "http://localhost:9000/v1");
  EXPECT_EQ(cfg.num_threads, 2);
  EXPECT_EQ(cfg.call_options("").timeout.count(), 15000);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, MalformedJsonThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  nlohmann::json j = {{"api_base_url", ""}};

  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, UnknownProviderThrows) {
  nlohmann::json j = {{"provider", "bedrock"}};

  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, OverlapMustBeSmallerThanChunkSize) {
  nlohmann::json j = {{"chunk_size", 100}, {"chunk_overlap", 100}};

  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, NonPositiveThreadsDefaultsAndValidates) {
  nlohmann::json j = {{"num_threads", 0}};

  // from_json will accept 0 then validate() should throw
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
  nlohmann::json j = {{"top_k", "five"}};

  Config cfg = Config::from_json(j);
  EXPECT_EQ(cfg.top_k, 3);
}

TEST(ConfigTest, RequestKeyOverridesConfiguredKey) {
  nlohmann::json j = {{"api_key", "sk-config"}};
  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.call_options("sk-request").api_key, "sk-request");
  EXPECT_EQ(cfg.call_options("").api_key, "sk-config");
}
