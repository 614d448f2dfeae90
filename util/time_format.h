#pragma once

#include <chrono>
#include <string>

namespace infergate {

// UTC ISO-8601 with millisecond precision, e.g. "2024-05-01T12:00:00.123Z".
std::string IsoTimestamp(std::chrono::system_clock::time_point tp);
inline std::string IsoTimestampNow() {
  return IsoTimestamp(std::chrono::system_clock::now());
}

} // namespace infergate
