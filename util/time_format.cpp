#include "util/time_format.h"

#include <cstdio>
#include <ctime>

namespace infergate {

std::string IsoTimestamp(std::chrono::system_clock::time_point tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count() %
                  1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(ms));
  return out;
}

} // namespace infergate
