#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <string>

namespace infergate {

// Incremental Server-Sent-Events parser for OpenAI-style streams.
//
// Bytes are accumulated until a newline; each complete "data:" line is a
// payload. "[DONE]" terminates the stream. Payloads that are not valid JSON
// are skipped and counted. An "error:" line (llama-server's failure framing)
// terminates the stream with the error text. Once terminated, further input
// is ignored, so the terminal state is reached exactly once.
class SseParser {
public:
  enum class State {
    kOpen,    // still accepting input
    kDone,    // "[DONE]" sentinel seen
    kStopped, // the chunk handler asked to stop
    kClosed,  // Finish() called without a sentinel
    kError,   // an "error:" line was received
  };

  // Returns false to stop consuming the stream.
  using ChunkHandler = std::function<bool(const nlohmann::json &chunk)>;

  explicit SseParser(ChunkHandler handler);

  // Feeds raw bytes. Returns true while the stream is still open.
  bool Feed(const char *data, std::size_t length);
  bool Feed(const std::string &data) { return Feed(data.data(), data.size()); }

  // Signals end of input; a trailing line without newline is still parsed.
  void Finish();

  State state() const { return state_; }
  bool Terminated() const { return state_ != State::kOpen; }
  const std::string &error() const { return error_; }
  std::size_t chunks_delivered() const { return delivered_; }
  std::size_t chunks_skipped() const { return skipped_; }

private:
  void HandleLine(std::string line);

  ChunkHandler handler_;
  std::string line_;
  State state_{State::kOpen};
  std::string error_;
  std::size_t delivered_{0};
  std::size_t skipped_{0};
};

const char *SseStateName(SseParser::State state);

} // namespace infergate
