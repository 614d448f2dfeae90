#pragma once

#include <functional>
#include <string>

namespace infergate {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Output format. Text lines look like
//   2024-05-01T12:00:00.123Z WARN  orchestrator: probe failed | model=llama3
// JSON mode writes one object per line with ts, level, component, message
// and (when given) extra.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below the threshold are dropped. Starts at INFO.
void SetLevel(Level level);
Level GetLevel();

// "debug", "info", "warn", "warning" or "error" in any case; anything else is
// INFO.
Level ParseLevel(const std::string &text);

// Receives every formatted line without the trailing newline. An empty sink
// restores stderr.
using Sink = std::function<void(const std::string &line)>;
void SetSink(Sink sink);

// `component` names the subsystem ("orchestrator", "catalog", "facade").
// `extra` carries key=value context and is left out when empty.
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace infergate
