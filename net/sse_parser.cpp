#include "net/sse_parser.h"

#include <utility>

using json = nlohmann::json;

namespace infergate {

namespace {

// Strips "<field>:" and one optional leading space.
bool StripField(const std::string &line, const char *field,
                std::string &value) {
  std::string prefix = std::string(field) + ":";
  if (line.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  value = line.substr(prefix.size());
  if (!value.empty() && value.front() == ' ') {
    value.erase(0, 1);
  }
  return true;
}

} // namespace

SseParser::SseParser(ChunkHandler handler) : handler_(std::move(handler)) {}

bool SseParser::Feed(const char *data, std::size_t length) {
  for (std::size_t i = 0; i < length && state_ == State::kOpen; ++i) {
    char c = data[i];
    if (c == '\n') {
      std::string line;
      line.swap(line_);
      HandleLine(std::move(line));
    } else {
      line_.push_back(c);
    }
  }
  return state_ == State::kOpen;
}

void SseParser::Finish() {
  if (state_ != State::kOpen) {
    return;
  }
  if (!line_.empty()) {
    std::string line;
    line.swap(line_);
    HandleLine(std::move(line));
  }
  if (state_ == State::kOpen) {
    state_ = State::kClosed;
  }
}

void SseParser::HandleLine(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  // Blank lines separate events; ":" lines are comments (keep-alives).
  if (line.empty() || line.front() == ':') {
    return;
  }
  std::string value;
  if (StripField(line, "error", value)) {
    error_ = value;
    try {
      auto parsed = json::parse(value);
      if (parsed.contains("message") && parsed["message"].is_string()) {
        error_ = parsed["message"].get<std::string>();
      } else if (parsed.contains("error")) {
        const auto &err = parsed["error"];
        error_ = err.is_object() && err.contains("message")
                     ? err["message"].get<std::string>()
                     : err.dump();
      }
    } catch (const json::exception &) {
      // Keep the raw text as the error message.
    }
    state_ = State::kError;
    return;
  }
  if (!StripField(line, "data", value)) {
    // "event:", "id:" and "retry:" fields carry nothing we use.
    return;
  }
  if (value == "[DONE]") {
    state_ = State::kDone;
    return;
  }
  json chunk;
  try {
    chunk = json::parse(value);
  } catch (const json::parse_error &) {
    ++skipped_;
    return;
  }
  ++delivered_;
  if (handler_ && !handler_(chunk)) {
    state_ = State::kStopped;
  }
}

const char *SseStateName(SseParser::State state) {
  switch (state) {
  case SseParser::State::kOpen:
    return "open";
  case SseParser::State::kDone:
    return "done";
  case SseParser::State::kStopped:
    return "stopped";
  case SseParser::State::kClosed:
    return "closed";
  case SseParser::State::kError:
    return "error";
  }
  return "unknown";
}

} // namespace infergate
