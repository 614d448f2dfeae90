#include "net/chunked_decoder.h"

#include <algorithm>
#include <stdexcept>

namespace infergate {

namespace {

constexpr std::size_t kMaxLine = 4096;

std::size_t ParseChunkSize(const std::string &line) {
  // Chunk extensions (";name=value") are ignored.
  auto end = line.find(';');
  std::string hex = line.substr(0, end);
  while (!hex.empty() && (hex.back() == ' ' || hex.back() == '\t')) {
    hex.pop_back();
  }
  if (hex.empty()) {
    throw std::runtime_error("chunked encoding: empty chunk size");
  }
  std::size_t value = 0;
  for (char c : hex) {
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      throw std::runtime_error("chunked encoding: invalid chunk size '" + hex +
                               "'");
    }
    value = value * 16 + static_cast<std::size_t>(digit);
  }
  return value;
}

} // namespace

void ChunkedDecoder::Feed(const char *data, std::size_t length,
                          std::string &out) {
  std::size_t pos = 0;
  while (pos < length && state_ != State::kDone) {
    switch (state_) {
    case State::kSize:
    case State::kDataEnd:
    case State::kTrailer: {
      char c = data[pos++];
      if (c != '\n') {
        if (c != '\r') {
          line_.push_back(c);
        }
        if (line_.size() > kMaxLine) {
          throw std::runtime_error("chunked encoding: line too long");
        }
        break;
      }
      std::string line;
      line.swap(line_);
      if (state_ == State::kDataEnd) {
        if (!line.empty()) {
          throw std::runtime_error("chunked encoding: missing CRLF after data");
        }
        state_ = State::kSize;
      } else if (state_ == State::kSize) {
        remaining_ = ParseChunkSize(line);
        state_ = remaining_ == 0 ? State::kTrailer : State::kData;
      } else if (line.empty()) {
        state_ = State::kDone;
      }
      break;
    }
    case State::kData: {
      std::size_t take = std::min(remaining_, length - pos);
      out.append(data + pos, take);
      pos += take;
      remaining_ -= take;
      if (remaining_ == 0) {
        state_ = State::kDataEnd;
      }
      break;
    }
    case State::kDone:
      break;
    }
  }
}

} // namespace infergate
