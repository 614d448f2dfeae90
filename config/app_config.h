#pragma once

#include "orchestrator/server_orchestrator.h"

#include <filesystem>
#include <string>

namespace infergate {

// Settings shared by infergatectl and embedding hosts. Read from
// <home>/config.yaml; every key is optional.
//
//   paths:
//     backends: /opt/infergate/backends
//     downloads: /var/tmp/infergate
//     state_file: /run/infergate/server_state.json
//     registry: ~/.infergate/registry.yaml
//   orchestrator:
//     host: 127.0.0.1
//     port_range: [8080, 8179]
//     startup_timeout_s: 60
//     probe_interval_ms: 500
//     stop_grace_s: 10
//     health_timeout_s: 5
//     health_staleness_s: 30
//     generation_timeout_s: 120
//     embeddings_timeout_s: 60
//     info_timeout_s: 10
//   backends:
//     release_url: https://api.github.com/repos/ggml-org/llama.cpp/releases/latest
//     release_tag: b4000        # pins a release instead of "latest"
//   legacy:
//     worker: /usr/local/bin/infergate-worker
//   logging:
//     format: text              # or json
//     level: info
struct AppConfig {
  std::filesystem::path home;
  std::filesystem::path backends_dir;
  std::filesystem::path downloads_dir;
  std::filesystem::path state_file;
  std::filesystem::path registry_file;

  OrchestratorOptions orchestrator;

  std::string release_url{
      "https://api.github.com/repos/ggml-org/llama.cpp/releases/latest"};
  std::string release_tag;

  std::filesystem::path legacy_worker;

  std::string log_format{"text"};
  std::string log_level{"info"};

  // Release metadata endpoint, honouring release_tag.
  std::string ReleaseApiUrl() const;
};

// $INFERGATE_HOME, else ~/.infergate, else ./.infergate.
std::filesystem::path DefaultHome();
std::filesystem::path DefaultConfigPath();

// Defaults rooted at `home`.
AppConfig DefaultAppConfig(const std::filesystem::path &home);

// A missing file yields the defaults. Values that fail to parse are logged
// and keep their defaults.
AppConfig LoadAppConfig(const std::filesystem::path &config_path,
                        const std::filesystem::path &home = DefaultHome());

// INFERGATE_LOG_FORMAT, INFERGATE_LOG_LEVEL, INFERGATE_LEGACY_WORKER and
// INFERGATE_RELEASE_TAG override the file.
void ApplyEnvironmentOverrides(AppConfig &config);

// Configures infergate::log from the logging section.
void ApplyLoggingConfig(const AppConfig &config);

} // namespace infergate
