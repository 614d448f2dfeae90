#include <catch2/catch.hpp>

#include "logging/logger.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace infergate;
using json = nlohmann::json;

namespace {

// Captures log lines for the lifetime of the guard and restores the global
// logger state afterwards.
class CapturedLog {
public:
  CapturedLog() : json_mode_(log::IsJsonMode()), level_(log::GetLevel()) {
    log::SetSink([this](const std::string &line) { lines.push_back(line); });
  }
  ~CapturedLog() {
    log::SetSink(nullptr);
    log::SetJsonMode(json_mode_);
    log::SetLevel(level_);
  }

  std::vector<std::string> lines;

private:
  bool json_mode_;
  log::Level level_;
};

} // namespace

// ---------------------------------------------------------------------------
// Text and JSON output
// ---------------------------------------------------------------------------

TEST_CASE("Logger writes text lines with context", "[logger]") {
  CapturedLog capture;
  log::SetJsonMode(false);
  log::SetLevel(log::Level::DEBUG);

  log::Warn("orchestrator", "probe failed", "model=llama3");
  log::Info("catalog", "installed");
  REQUIRE(capture.lines.size() == 2u);

  const auto &warn = capture.lines[0];
  REQUIRE(warn.find("WARN  orchestrator: probe failed | model=llama3") !=
          std::string::npos);
  REQUIRE(warn.find('Z') == 23u);
  REQUIRE(capture.lines[1].find(" | ") == std::string::npos);
}

TEST_CASE("Logger writes one JSON object per line", "[logger]") {
  CapturedLog capture;
  log::SetJsonMode(true);
  REQUIRE(log::IsJsonMode());

  log::Error("facade", "dropped \"model\"", "pid=42");
  log::Info("facade", "plain");
  REQUIRE(capture.lines.size() == 2u);

  auto entry = json::parse(capture.lines[0]);
  REQUIRE(entry["level"] == "ERROR");
  REQUIRE(entry["component"] == "facade");
  REQUIRE(entry["message"] == "dropped \"model\"");
  REQUIRE(entry["extra"] == "pid=42");
  REQUIRE(entry["ts"].get<std::string>().size() == 24u);
  REQUIRE_FALSE(json::parse(capture.lines[1]).contains("extra"));
}

TEST_CASE("Logger replaces invalid UTF-8 in JSON mode", "[logger]") {
  CapturedLog capture;
  log::SetJsonMode(true);
  REQUIRE_NOTHROW(log::Warn("orchestrator", "stderr", "tail=\xff\xfe"));
  REQUIRE(capture.lines.size() == 1u);
  REQUIRE_NOTHROW(json::parse(capture.lines[0]));
}

// ---------------------------------------------------------------------------
// Threshold
// ---------------------------------------------------------------------------

TEST_CASE("Logger drops entries below the threshold", "[logger]") {
  CapturedLog capture;
  log::SetJsonMode(false);
  log::SetLevel(log::Level::WARN);
  REQUIRE(log::GetLevel() == log::Level::WARN);

  log::Debug("test", "dropped");
  log::Info("test", "dropped");
  log::Warn("test", "kept");
  log::Error("test", "kept");
  REQUIRE(capture.lines.size() == 2u);
}

TEST_CASE("ParseLevel accepts names case-insensitively", "[logger]") {
  REQUIRE(log::ParseLevel("debug") == log::Level::DEBUG);
  REQUIRE(log::ParseLevel("INFO") == log::Level::INFO);
  REQUIRE(log::ParseLevel("Warning") == log::Level::WARN);
  REQUIRE(log::ParseLevel("warn") == log::Level::WARN);
  REQUIRE(log::ParseLevel("ERROR") == log::Level::ERROR);
  REQUIRE(log::ParseLevel("verbose") == log::Level::INFO);
}
