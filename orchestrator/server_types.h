#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace infergate {

enum class ErrorKind {
  kNone,
  kConfiguration,  // no backend, model file missing, invalid config
  kStartupTimeout, // server never became healthy; process killed
  kPortExhaustion, // no free port in range
  kTransport,      // HTTP failure, timeout or non-2xx reply
  kProcessDeath,   // a running server stopped answering probes
  kNotFound,       // unknown model id
};

const char *ErrorKindName(ErrorKind kind);

enum class ServerStatus { kStarting, kRunning, kUnhealthy, kStopped };

const char *ServerStatusName(ServerStatus status);
ServerStatus ParseServerStatus(const std::string &text);

struct ServerInstance {
  std::string model_id;
  std::string model_path;
  std::string host{"127.0.0.1"};
  int port{0};
  int pid{0};
  ServerStatus status{ServerStatus::kStarting};
  std::string backend_id;
  std::string started_at; // ISO-8601
  int context_size{0};
  int gpu_layers{0};
  std::string last_healthy; // ISO-8601 of the last successful probe

  std::string BaseUrl() const {
    return "http://" + host + ":" + std::to_string(port);
  }
};

// Persisted form uses the snake_case keys of the state file.
void to_json(nlohmann::json &j, const ServerInstance &instance);
void from_json(const nlohmann::json &j, ServerInstance &instance);

// Every orchestrator operation reports expected failures through these
// fields instead of throwing.
struct OpStatus {
  bool ok{false};
  ErrorKind error{ErrorKind::kNone};
  std::string message;
};

struct StartResult : OpStatus {
  ServerInstance instance;
  bool already_running{false};
  std::string stderr_tail;
};

struct StopResult : OpStatus {
  bool graceful{false};
};

struct ProxyResult : OpStatus {
  int http_status{0};
  nlohmann::json body;
  double latency_ms{0.0};
};

struct StreamResult : OpStatus {
  int http_status{0};
  std::size_t chunks{0};
  std::size_t skipped{0};
  bool done{false};    // "[DONE]" received
  bool stopped{false}; // the consumer stopped early
};

struct TokenizeResult : OpStatus {
  int count{0};
  bool estimated{false};
};

struct MetricsResult : OpStatus {
  std::string prometheus; // set when /metrics answered
  nlohmann::json health;  // set when falling back to /health
  bool from_health{false};
};

} // namespace infergate
