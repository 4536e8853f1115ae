#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace docchat_core {

/**
 * @class SseParser
 * @brief Incremental parser for a text/event-stream body.
 *
 * Network reads split events at arbitrary byte positions, so input is
 * buffered until a full line arrives. Each event's `data:` lines are joined
 * with '\n' and handed to the callback when the blank line that terminates
 * the event is seen. Comments and other fields are ignored.
 */
class SseParser {
 public:
  // Returns false to stop parsing; feed() then reports false as well.
  using EventHandler = std::function<bool(const std::string &data)>;

  bool feed(std::string_view bytes, const EventHandler &on_event);

  // Dispatches an event left unterminated when the stream closed.
  bool finish(const EventHandler &on_event);

 private:
  bool process_line(std::string_view line, const EventHandler &on_event);
  bool dispatch(const EventHandler &on_event);

  std::string buffer_;
  std::string data_;
  bool has_data_ = false;
};

}  // namespace docchat_core
