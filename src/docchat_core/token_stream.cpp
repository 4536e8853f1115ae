#include "docchat_core/token_stream.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>

#include "docchat_core/errors.hpp"

namespace docchat_core {

struct TokenStream::State {
  explicit State(size_t capacity) : capacity(capacity) {}

  std::mutex mutex;
  std::condition_variable cv;
  std::deque<std::string> fragments;
  const size_t capacity;
  std::atomic<bool> cancelled{false};
  bool finished = false;
  StreamEnd end = StreamEnd::Completed;
  std::exception_ptr error;
};

TokenStream TokenStream::start(Producer producer, size_t queue_capacity) {
  if (!producer) {
    throw InvalidArgumentError("TokenStream requires a producer");
  }
  if (queue_capacity == 0) {
    throw ConfigurationError("TokenStream queue capacity must be greater than 0");
  }
  auto state = std::make_shared<State>(queue_capacity);

  std::thread thread([state, producer = std::move(producer)] {
    StreamHandlers handlers;
    handlers.on_fragment = [state](const std::string &fragment) {
      std::unique_lock<std::mutex> lock(state->mutex);
      state->cv.wait(lock, [&state] {
        return state->fragments.size() < state->capacity || state->cancelled.load();
      });
      if (state->cancelled.load()) {
        return;
      }
      state->fragments.push_back(fragment);
      state->cv.notify_all();
    };
    handlers.should_stop = [state] { return state->cancelled.load(); };

    StreamEnd end = StreamEnd::Completed;
    std::exception_ptr error;
    try {
      end = producer(handlers);
    } catch (const DocchatError &) {
      error = std::current_exception();
    } catch (const std::exception &e) {
      error = std::make_exception_ptr(
          GenerationProviderError(std::string("Generation failed: ") + e.what()));
    } catch (...) {
      error = std::make_exception_ptr(
          GenerationProviderError("Generation failed with an unknown error"));
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    state->finished = true;
    if (state->cancelled.load()) {
      state->end = StreamEnd::Cancelled;
    } else if (error) {
      state->end = StreamEnd::Failed;
      state->error = error;
    } else {
      state->end = end;
    }
    state->cv.notify_all();
  });

  return TokenStream(std::move(state), std::move(thread));
}

TokenStream::TokenStream(std::shared_ptr<State> state, std::thread producer)
    : state_(std::move(state)), producer_(std::move(producer)) {}

TokenStream::~TokenStream() {
  if (state_) {
    cancel();
  }
  if (producer_.joinable()) {
    producer_.join();
  }
}

std::optional<std::string> TokenStream::next() {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait(lock, [this] {
    return !state_->fragments.empty() || state_->finished || state_->cancelled.load();
  });

  if (state_->cancelled.load()) {
    return std::nullopt;
  }
  if (!state_->fragments.empty()) {
    std::string fragment = std::move(state_->fragments.front());
    state_->fragments.pop_front();
    state_->cv.notify_all();
    return fragment;
  }
  if (state_->error) {
    std::exception_ptr error = state_->error;
    state_->error = nullptr;
    std::rethrow_exception(error);
  }
  return std::nullopt;
}

void TokenStream::cancel() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  // A fully drained stream has nothing left to cancel.
  if (state_->finished && state_->fragments.empty() && !state_->error) {
    return;
  }
  state_->cancelled.store(true);
  state_->fragments.clear();
  state_->error = nullptr;
  if (state_->finished) {
    state_->end = StreamEnd::Cancelled;
  }
  state_->cv.notify_all();
}

StreamEnd TokenStream::end_reason() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->cancelled.load()) {
    return StreamEnd::Cancelled;
  }
  return state_->end;
}

}  // namespace docchat_core
