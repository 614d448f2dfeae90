#include "config/app_config.h"

#include "logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace infergate {

namespace {

// Reads node[key] into `out`, leaving `out` untouched when the key is absent
// or its value does not convert.
template <typename T>
void Read(const YAML::Node &node, const char *key, T &out,
          const std::string &section) {
  if (!node || !node[key]) {
    return;
  }
  try {
    out = node[key].as<T>();
  } catch (const YAML::Exception &ex) {
    log::Warn("config", "ignoring invalid value",
              section + "." + key + ": " + ex.what());
  }
}

void ReadPath(const YAML::Node &node, const char *key, fs::path &out,
              const std::string &section) {
  std::string value;
  Read(node, key, value, section);
  if (value.empty()) {
    return;
  }
  if (value[0] == '~') {
    if (const char *home = std::getenv("HOME")) {
      value = std::string(home) + value.substr(1);
    }
  }
  out = value;
}

void ReadSeconds(const YAML::Node &node, const char *key,
                 std::chrono::milliseconds &out, const std::string &section) {
  double seconds = -1.0;
  Read(node, key, seconds, section);
  if (seconds > 0) {
    out = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
  } else if (node && node[key]) {
    log::Warn("config", "ignoring non-positive timeout",
              section + "." + key);
  }
}

void ReadMillis(const YAML::Node &node, const char *key,
                std::chrono::milliseconds &out, const std::string &section) {
  long long ms = -1;
  Read(node, key, ms, section);
  if (ms > 0) {
    out = std::chrono::milliseconds(ms);
  } else if (node && node[key]) {
    log::Warn("config", "ignoring non-positive interval",
              section + "." + key);
  }
}

void ParseOrchestrator(const YAML::Node &node, OrchestratorOptions &options) {
  const std::string section = "orchestrator";
  Read(node, "host", options.host, section);
  if (node["port_range"]) {
    std::vector<int> range;
    Read(node, "port_range", range, section);
    if (range.size() == 2 && range[0] > 0 && range[0] <= range[1] &&
        range[1] <= 65535) {
      options.port_first = range[0];
      options.port_last = range[1];
    } else {
      log::Warn("config", "ignoring invalid port_range",
                "expected [first, last] within 1-65535");
    }
  }
  ReadSeconds(node, "startup_timeout_s", options.startup_timeout, section);
  ReadMillis(node, "probe_interval_ms", options.probe_interval, section);
  ReadSeconds(node, "stop_grace_s", options.stop_grace, section);
  ReadSeconds(node, "health_timeout_s", options.health_timeout, section);
  ReadSeconds(node, "health_staleness_s", options.health_staleness, section);
  ReadSeconds(node, "generation_timeout_s", options.generation_timeout,
              section);
  ReadSeconds(node, "embeddings_timeout_s", options.embeddings_timeout,
              section);
  ReadSeconds(node, "info_timeout_s", options.info_timeout, section);
}

} // namespace

std::string AppConfig::ReleaseApiUrl() const {
  if (release_tag.empty()) {
    return release_url;
  }
  const std::string latest = "/releases/latest";
  auto pos = release_url.rfind(latest);
  if (pos == std::string::npos) {
    return release_url;
  }
  return release_url.substr(0, pos) + "/releases/tags/" + release_tag;
}

fs::path DefaultHome() {
  if (const char *env = std::getenv("INFERGATE_HOME")) {
    if (*env) {
      return fs::path(env);
    }
  }
  if (const char *home = std::getenv("HOME")) {
    return fs::path(home) / ".infergate";
  }
  std::error_code ec;
  return fs::current_path(ec) / ".infergate";
}

fs::path DefaultConfigPath() { return DefaultHome() / "config.yaml"; }

AppConfig DefaultAppConfig(const fs::path &home) {
  AppConfig config;
  config.home = home;
  config.backends_dir = home / "backends";
  config.downloads_dir = home / "downloads";
  config.state_file = home / "server_state.json";
  config.registry_file = home / "registry.yaml";
  config.orchestrator.state_file = config.state_file;
  return config;
}

AppConfig LoadAppConfig(const fs::path &config_path, const fs::path &home) {
  AppConfig config = DefaultAppConfig(home);
  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    log::Debug("config", "no config file, using defaults",
               config_path.string());
    return config;
  }
  try {
    YAML::Node root = YAML::LoadFile(config_path.string());

    if (root["paths"]) {
      const auto &paths = root["paths"];
      ReadPath(paths, "backends", config.backends_dir, "paths");
      ReadPath(paths, "downloads", config.downloads_dir, "paths");
      ReadPath(paths, "state_file", config.state_file, "paths");
      ReadPath(paths, "registry", config.registry_file, "paths");
    }
    if (root["orchestrator"]) {
      ParseOrchestrator(root["orchestrator"], config.orchestrator);
    }
    if (root["backends"]) {
      Read(root["backends"], "release_url", config.release_url, "backends");
      Read(root["backends"], "release_tag", config.release_tag, "backends");
    }
    if (root["legacy"]) {
      ReadPath(root["legacy"], "worker", config.legacy_worker, "legacy");
    }
    if (root["logging"]) {
      Read(root["logging"], "format", config.log_format, "logging");
      Read(root["logging"], "level", config.log_level, "logging");
    }
  } catch (const YAML::Exception &ex) {
    log::Error("config", "failed to parse config file, using defaults",
               config_path.string() + ": " + ex.what());
    return DefaultAppConfig(home);
  }
  config.orchestrator.state_file = config.state_file;
  return config;
}

void ApplyEnvironmentOverrides(AppConfig &config) {
  if (const char *format = std::getenv("INFERGATE_LOG_FORMAT")) {
    config.log_format = format;
  }
  if (const char *level = std::getenv("INFERGATE_LOG_LEVEL")) {
    config.log_level = level;
  }
  if (const char *worker = std::getenv("INFERGATE_LEGACY_WORKER")) {
    config.legacy_worker = worker;
  }
  if (const char *tag = std::getenv("INFERGATE_RELEASE_TAG")) {
    config.release_tag = tag;
  }
}

void ApplyLoggingConfig(const AppConfig &config) {
  log::SetJsonMode(config.log_format == "json");
  log::SetLevel(log::ParseLevel(config.log_level));
}

} // namespace infergate
