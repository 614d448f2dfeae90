#include "logging/logger.h"

#include "util/time_format.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <iterator>
#include <mutex>

using json = nlohmann::json;

namespace infergate {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_threshold{static_cast<int>(Level::INFO)};

// Guards g_sink and serializes writes so lines never interleave.
std::mutex g_write_mutex;
Sink g_sink;

const char *LevelName(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "?";
}

std::string FormatText(Level level, const std::string &ts,
                       const std::string &component,
                       const std::string &message, const std::string &extra) {
  std::string name = LevelName(level);
  name.resize(5, ' ');
  std::string line = ts + " " + name + " " + component + ": " + message;
  if (!extra.empty()) {
    line += " | " + extra;
  }
  return line;
}

std::string FormatJson(Level level, const std::string &ts,
                       const std::string &component,
                       const std::string &message, const std::string &extra) {
  json entry{{"ts", ts},
             {"level", LevelName(level)},
             {"component", component},
             {"message", message}};
  if (!extra.empty()) {
    entry["extra"] = extra;
  }
  // Child process output can carry invalid UTF-8.
  return entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetLevel(Level level) { g_threshold.store(static_cast<int>(level)); }
Level GetLevel() { return static_cast<Level>(g_threshold.load()); }

Level ParseLevel(const std::string &text) {
  std::string name;
  name.reserve(text.size());
  std::transform(text.begin(), text.end(), std::back_inserter(name),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (name == "debug") {
    return Level::DEBUG;
  }
  if (name == "warn" || name == "warning") {
    return Level::WARN;
  }
  if (name == "error") {
    return Level::ERROR;
  }
  return Level::INFO;
}

void SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_write_mutex);
  g_sink = std::move(sink);
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_threshold.load()) {
    return;
  }
  const std::string ts = IsoTimestampNow();
  const std::string line =
      g_json_mode.load() ? FormatJson(level, ts, component, message, extra)
                         : FormatText(level, ts, component, message, extra);

  std::lock_guard<std::mutex> lock(g_write_mutex);
  if (g_sink) {
    g_sink(line);
  } else {
    std::cerr << line << "\n";
  }
}

} // namespace log
} // namespace infergate
