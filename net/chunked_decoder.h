#pragma once

#include <cstddef>
#include <string>

namespace infergate {

// Incremental decoder for HTTP/1.1 "Transfer-Encoding: chunked" bodies.
// Input may be split at any byte; decoded payload bytes are appended to the
// output string. Malformed framing throws std::runtime_error.
class ChunkedDecoder {
public:
  void Feed(const char *data, std::size_t length, std::string &out);

  // True once the terminating zero-length chunk and its trailer were read.
  bool Done() const { return state_ == State::kDone; }

private:
  enum class State { kSize, kData, kDataEnd, kTrailer, kDone };

  State state_{State::kSize};
  std::string line_;
  std::size_t remaining_{0};
};

} // namespace infergate
