#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "docchat_api/chat_session.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/generation_pipeline.hpp"
#include "docchat_core/services/rag_service.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace docchat_api {

using ::testing::_;
using ::testing::Invoke;
using ::testing::Throw;

class ChatSessionTest : public docchat_tests::RetrievalPipelineTestBase {
 protected:
  void SetUp() override {
    RetrievalPipelineTestBase::SetUp();
    mock_generation_ =
        std::make_shared<::testing::NiceMock<docchat_tests::MockGenerationProvider>>();
    auto generation =
        std::make_shared<docchat_core::GenerationPipeline>(mock_generation_, "gpt-4.1-mini");
    service_ = std::make_shared<docchat_core::RagService>(pipeline_, generation);
    session_ = std::make_unique<ChatSession>(
        service_, Config::from_json({{"api_key", "sk-config"}}),
        [this](const std::string& frame) { record(frame); });
  }

  void record(const std::string& frame) {
    std::lock_guard<std::mutex> lock(frames_mutex_);
    frames_.push_back(nlohmann::json::parse(frame));
    frames_cv_.notify_all();
  }

  bool wait_for_frames(size_t count) {
    std::unique_lock<std::mutex> lock(frames_mutex_);
    return frames_cv_.wait_for(lock, std::chrono::seconds(5),
                               [&] { return frames_.size() >= count; });
  }

  std::vector<nlohmann::json> frames() {
    std::lock_guard<std::mutex> lock(frames_mutex_);
    return frames_;
  }

  std::shared_ptr<::testing::NiceMock<docchat_tests::MockGenerationProvider>> mock_generation_;
  std::shared_ptr<docchat_core::RagService> service_;
  std::unique_ptr<ChatSession> session_;

  std::mutex frames_mutex_;
  std::condition_variable frames_cv_;
  std::vector<nlohmann::json> frames_;
};

TEST_F(ChatSessionTest, SendsFragmentsThenEndReason) {
  EXPECT_CALL(*mock_generation_, stream_chat(_, _, _))
      .WillOnce(Invoke([](const docchat_core::ChatRequest&, const docchat_core::CallOptions&,
                          const docchat_core::StreamHandlers& handlers) {
        handlers.on_fragment("Hello ");
        handlers.on_fragment("there");
        return docchat_core::StreamEnd::Completed;
      }));

  session_->start(nlohmann::json{{"developer_message", "Be kind."}, {"user_message", "hi"}}.dump());
  session_->wait();

  auto sent = frames();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[0]["type"], "fragment");
  EXPECT_EQ(sent[0]["content"], "Hello ");
  EXPECT_EQ(sent[1]["content"], "there");
  EXPECT_EQ(sent[2]["type"], "end");
  EXPECT_EQ(sent[2]["status"], "completed");
}

TEST_F(ChatSessionTest, TimedOutAnswerEndsWithTimedOutStatus) {
  EXPECT_CALL(*mock_generation_, stream_chat(_, _, _))
      .WillOnce(Invoke([](const docchat_core::ChatRequest&, const docchat_core::CallOptions&,
                          const docchat_core::StreamHandlers& handlers) {
        handlers.on_fragment("Partial");
        return docchat_core::StreamEnd::TimedOut;
      }));

  session_->start(nlohmann::json{{"user_message", "hi"}}.dump());
  session_->wait();

  auto sent = frames();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[1]["type"], "end");
  EXPECT_EQ(sent[1]["status"], "timed_out");
}

// Closing the connection mid-answer stops the provider and silences the session.
TEST_F(ChatSessionTest, CancelStopsProviderAndSendsNothingMore) {
  std::atomic<bool> provider_saw_stop{false};
  EXPECT_CALL(*mock_generation_, stream_chat(_, _, _))
      .WillOnce(Invoke([&provider_saw_stop](const docchat_core::ChatRequest&,
                                            const docchat_core::CallOptions&,
                                            const docchat_core::StreamHandlers& handlers) {
        handlers.on_fragment("first");
        while (!handlers.should_stop()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        provider_saw_stop = true;
        return docchat_core::StreamEnd::Cancelled;
      }));

  session_->start(nlohmann::json{{"user_message", "hi"}}.dump());
  ASSERT_TRUE(wait_for_frames(1));
  session_->cancel();
  session_->wait();

  EXPECT_TRUE(provider_saw_stop.load());
  auto sent = frames();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0]["content"], "first");
}

TEST_F(ChatSessionTest, FailureAfterTextEndsWithFailedStatus) {
  EXPECT_CALL(*mock_generation_, stream_chat(_, _, _))
      .WillOnce(Invoke([](const docchat_core::ChatRequest&, const docchat_core::CallOptions&,
                          const docchat_core::StreamHandlers& handlers) -> docchat_core::StreamEnd {
        handlers.on_fragment("Half an");
        throw docchat_core::GenerationProviderError("connection reset");
      }));

  session_->start(nlohmann::json{{"user_message", "hi"}}.dump());
  session_->wait();

  auto sent = frames();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0]["content"], "Half an");
  EXPECT_EQ(sent[1]["type"], "end");
  EXPECT_EQ(sent[1]["status"], "failed");
  EXPECT_THAT(sent[1]["error"].get<std::string>(), ::testing::HasSubstr("connection reset"));
}

TEST_F(ChatSessionTest, FailureBeforeTextIsBadGatewayError) {
  EXPECT_CALL(*mock_generation_, stream_chat(_, _, _))
      .WillOnce(Throw(docchat_core::GenerationProviderError("HTTP 401")));

  session_->start(nlohmann::json{{"user_message", "hi"}}.dump());
  session_->wait();

  auto sent = frames();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0]["type"], "error");
  EXPECT_EQ(sent[0]["status_code"], 502);
}

TEST_F(ChatSessionTest, BadMessagesAreBadRequestErrors) {
  EXPECT_CALL(*mock_generation_, stream_chat(_, _, _)).Times(0);

  session_->start("{not json");
  session_->wait();
  session_->start(nlohmann::json{{"developer_message", "x"}}.dump());
  session_->wait();

  auto sent = frames();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0]["type"], "error");
  EXPECT_EQ(sent[0]["status_code"], 400);
  EXPECT_EQ(sent[1]["type"], "error");
  EXPECT_EQ(sent[1]["status_code"], 400);
}

TEST_F(ChatSessionTest, NewMessageReplacesRunningAnswer) {
  EXPECT_CALL(*mock_generation_, stream_chat(_, _, _))
      .WillOnce(Invoke([](const docchat_core::ChatRequest&, const docchat_core::CallOptions&,
                          const docchat_core::StreamHandlers& handlers) {
        handlers.on_fragment("old");
        while (!handlers.should_stop()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return docchat_core::StreamEnd::Cancelled;
      }))
      .WillOnce(Invoke([](const docchat_core::ChatRequest&, const docchat_core::CallOptions&,
                          const docchat_core::StreamHandlers& handlers) {
        handlers.on_fragment("new");
        return docchat_core::StreamEnd::Completed;
      }));

  session_->start(nlohmann::json{{"user_message", "first"}}.dump());
  ASSERT_TRUE(wait_for_frames(1));
  session_->start(nlohmann::json{{"user_message", "second"}}.dump());
  session_->wait();

  auto sent = frames();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[0]["content"], "old");
  EXPECT_EQ(sent[1]["content"], "new");
  EXPECT_EQ(sent[2]["status"], "completed");
}

}  // namespace docchat_api
