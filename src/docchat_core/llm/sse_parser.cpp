#include "docchat_core/llm/sse_parser.hpp"

namespace docchat_core {

bool SseParser::feed(std::string_view bytes, const EventHandler &on_event) {
  buffer_.append(bytes.data(), bytes.size());

  size_t line_start = 0;
  size_t newline = buffer_.find('\n', line_start);
  while (newline != std::string::npos) {
    std::string_view line(buffer_.data() + line_start, newline - line_start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!process_line(line, on_event)) {
      buffer_.erase(0, newline + 1);
      return false;
    }
    line_start = newline + 1;
    newline = buffer_.find('\n', line_start);
  }
  buffer_.erase(0, line_start);
  return true;
}

bool SseParser::finish(const EventHandler &on_event) {
  if (!buffer_.empty()) {
    std::string rest;
    rest.swap(buffer_);
    if (!rest.empty() && rest.back() == '\r') {
      rest.pop_back();
    }
    if (!process_line(rest, on_event)) {
      return false;
    }
  }
  return dispatch(on_event);
}

bool SseParser::process_line(std::string_view line, const EventHandler &on_event) {
  if (line.empty()) {
    return dispatch(on_event);
  }
  if (line.front() == ':') {
    return true;
  }

  std::string_view field = line;
  std::string_view value;
  size_t colon = line.find(':');
  if (colon != std::string_view::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
  }

  if (field == "data") {
    if (has_data_) {
      data_.push_back('\n');
    }
    data_.append(value.data(), value.size());
    has_data_ = true;
  }
  return true;
}

bool SseParser::dispatch(const EventHandler &on_event) {
  if (!has_data_) {
    return true;
  }
  std::string data;
  data.swap(data_);
  has_data_ = false;
  return on_event(data);
}

}  // namespace docchat_core
