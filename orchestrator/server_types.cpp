#include "orchestrator/server_types.h"

namespace infergate {

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kConfiguration:
    return "configuration";
  case ErrorKind::kStartupTimeout:
    return "startup_timeout";
  case ErrorKind::kPortExhaustion:
    return "port_exhaustion";
  case ErrorKind::kTransport:
    return "transport";
  case ErrorKind::kProcessDeath:
    return "process_death";
  case ErrorKind::kNotFound:
    return "not_found";
  }
  return "unknown";
}

const char *ServerStatusName(ServerStatus status) {
  switch (status) {
  case ServerStatus::kStarting:
    return "starting";
  case ServerStatus::kRunning:
    return "running";
  case ServerStatus::kUnhealthy:
    return "unhealthy";
  case ServerStatus::kStopped:
    return "stopped";
  }
  return "unknown";
}

ServerStatus ParseServerStatus(const std::string &text) {
  if (text == "running") {
    return ServerStatus::kRunning;
  }
  if (text == "unhealthy") {
    return ServerStatus::kUnhealthy;
  }
  if (text == "stopped") {
    return ServerStatus::kStopped;
  }
  return ServerStatus::kStarting;
}

void to_json(nlohmann::json &j, const ServerInstance &instance) {
  j = nlohmann::json{{"model_id", instance.model_id},
                     {"model_path", instance.model_path},
                     {"host", instance.host},
                     {"port", instance.port},
                     {"pid", instance.pid},
                     {"status", ServerStatusName(instance.status)},
                     {"backend", instance.backend_id},
                     {"started_at", instance.started_at},
                     {"context_size", instance.context_size},
                     {"gpu_layers", instance.gpu_layers}};
  if (!instance.last_healthy.empty()) {
    j["last_healthy"] = instance.last_healthy;
  }
}

void from_json(const nlohmann::json &j, ServerInstance &instance) {
  instance.model_id = j.value("model_id", "");
  instance.model_path = j.value("model_path", "");
  instance.host = j.value("host", "127.0.0.1");
  instance.port = j.value("port", 0);
  instance.pid = j.value("pid", 0);
  instance.status = ParseServerStatus(j.value("status", "starting"));
  instance.backend_id = j.value("backend", "");
  instance.started_at = j.value("started_at", "");
  instance.context_size = j.value("context_size", 0);
  instance.gpu_layers = j.value("gpu_layers", 0);
  instance.last_healthy = j.value("last_healthy", "");
}

} // namespace infergate
