#include "orchestrator/server_orchestrator.h"

#include "backends/backend_catalog.h"
#include "logging/logger.h"
#include "metrics/metrics.h"
#include "net/sse_parser.h"
#include "util/time_format.h"

#include <cstdlib>
#include <system_error>
#include <thread>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace infergate {

namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start)
      .count();
}

std::string Excerpt(const std::string &body, std::size_t max = 300) {
  if (body.size() <= max) {
    return body;
  }
  return body.substr(0, max) + "...";
}

HttpHeaders AuthHeaders(const std::string &api_key) {
  HttpHeaders headers;
  if (!api_key.empty()) {
    headers["Authorization"] = "Bearer " + api_key;
  }
  return headers;
}

template <typename Result>
Result Fail(ErrorKind kind, const std::string &message) {
  Result result;
  result.ok = false;
  result.error = kind;
  result.message = message;
  return result;
}

} // namespace

ServerOrchestrator::ServerOrchestrator(const BackendCatalog *catalog,
                                       OrchestratorOptions options,
                                       std::shared_ptr<ProcessLauncher> launcher,
                                       MetricsRegistry *metrics)
    : catalog_(catalog), options_(std::move(options)),
      launcher_(launcher ? std::move(launcher)
                         : std::make_shared<PosixProcessLauncher>()),
      metrics_(metrics),
      ports_(options_.host, options_.port_first, options_.port_last),
      store_(options_.state_file) {
  CleanupOrphans();
}

ServerOrchestrator::~ServerOrchestrator() { StopAll(); }

void ServerOrchestrator::CleanupOrphans() {
  auto persisted = store_.Load();
  if (persisted.empty()) {
    store_.Clear();
    return;
  }
  // Servers never outlive the process that started them, so every pid on
  // record belongs to a previous run.
  for (const auto &[model_id, instance] : persisted) {
    if (instance.pid <= 0) {
      continue;
    }
    if (launcher_->KillPid(instance.pid)) {
      ++orphans_killed_;
      if (metrics_) {
        metrics_->RecordOrphanKill();
      }
      log::Info("orchestrator", "killed orphaned server",
                "model=" + model_id + " pid=" + std::to_string(instance.pid));
    } else {
      log::Debug("orchestrator", "orphaned server already gone",
                 "model=" + model_id + " pid=" + std::to_string(instance.pid));
    }
  }
  store_.Clear();
}

void ServerOrchestrator::SetRemovalCallback(RemovalCallback callback) {
  std::lock_guard<std::mutex> lock(removal_mutex_);
  on_removed_ = std::move(callback);
}

void ServerOrchestrator::NotifyRemoved(const std::string &model_id) {
  std::lock_guard<std::mutex> lock(removal_mutex_);
  if (on_removed_) {
    on_removed_(model_id);
  }
}

bool ServerOrchestrator::Probe(const std::string &host, int port,
                               std::chrono::milliseconds timeout) const {
  try {
    auto response =
        client_.Get("http://" + host + ":" + std::to_string(port) + "/health",
                    {}, timeout);
    return response.status == 200;
  } catch (const std::exception &) {
    return false;
  }
}

void ServerOrchestrator::PersistLocked() {
  std::map<std::string, ServerInstance> table;
  for (const auto &[model_id, entry] : servers_) {
    table[model_id] = entry.instance;
  }
  store_.Save(table);
  if (metrics_) {
    metrics_->SetRunningServers(static_cast<int>(servers_.size()));
  }
}

std::optional<ServerOrchestrator::Target>
ServerOrchestrator::Lookup(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(model_id);
  if (it == servers_.end()) {
    return std::nullopt;
  }
  return Target{it->second.instance, it->second.api_key};
}

std::optional<ServerInstance>
ServerOrchestrator::GetServer(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(model_id);
  if (it == servers_.end()) {
    return std::nullopt;
  }
  ServerInstance instance = it->second.instance;
  if (instance.status == ServerStatus::kRunning &&
      Clock::now() - it->second.healthy_at > options_.health_staleness) {
    instance.status = ServerStatus::kUnhealthy;
  }
  return instance;
}

void ServerOrchestrator::MarkHealthy(const std::string &model_id,
                                     int expected_pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(model_id);
  if (it != servers_.end() && it->second.instance.pid == expected_pid) {
    it->second.instance.status = ServerStatus::kRunning;
    it->second.instance.last_healthy = IsoTimestampNow();
    it->second.healthy_at = Clock::now();
  }
}

void ServerOrchestrator::Evict(const std::string &model_id, int expected_pid) {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(model_id);
    if (it == servers_.end() || it->second.instance.pid != expected_pid) {
      return;
    }
    entry = std::move(it->second);
    servers_.erase(it);
    PersistLocked();
  }
  log::Warn("orchestrator", "evicting unresponsive server",
            "model=" + model_id + " pid=" + std::to_string(expected_pid));
  if (entry.process) {
    entry.process->Kill();
  }
  ports_.Release(entry.instance.port);
  if (metrics_) {
    metrics_->RecordServerEviction();
  }
  NotifyRemoved(model_id);
}

StartResult ServerOrchestrator::Start(const std::string &model_id,
                                      const std::string &model_path,
                                      const ServerConfig &config,
                                      const std::string &backend_id) {
  if (model_id.empty()) {
    return Fail<StartResult>(ErrorKind::kConfiguration,
                             "model id is required");
  }
  KeyedMutex::Guard start_lock(start_locks_, model_id);

  // 1. Idempotent when a healthy server already exists.
  if (auto existing = Lookup(model_id)) {
    const auto &instance = existing->instance;
    if (Probe(instance.host, instance.port, options_.health_timeout)) {
      MarkHealthy(model_id, instance.pid);
      StartResult result;
      result.ok = true;
      result.already_running = true;
      result.instance = GetServer(model_id).value_or(instance);
      result.message = "Server already running";
      return result;
    }
    Evict(model_id, instance.pid);
  }

  auto fail = [this](ErrorKind kind, const std::string &message) {
    log::Error("orchestrator", message);
    if (metrics_) {
      metrics_->RecordServerStartFailure(ErrorKindName(kind));
    }
    return Fail<StartResult>(kind, message);
  };

  // 2. Resolve the executable.
  if (!catalog_) {
    return fail(ErrorKind::kConfiguration, "No backend catalog configured");
  }
  auto executable = catalog_->GetServerExecutable(backend_id);
  if (!executable) {
    return fail(ErrorKind::kConfiguration,
                backend_id.empty()
                    ? "No llama-server backend installed"
                    : "llama-server not found for backend " + backend_id);
  }
  std::string resolved_backend = backend_id;
  if (resolved_backend.empty()) {
    if (auto active = catalog_->ActiveBackend()) {
      resolved_backend = active->id;
    }
  }

  // 3. Validate the model.
  std::error_code ec;
  if (model_path.empty() || !fs::is_regular_file(model_path, ec)) {
    return fail(ErrorKind::kConfiguration,
                "Model file not found: " + model_path);
  }

  // 4. Allocate a port.
  int port = 0;
  if (config.port > 0) {
    if (!ports_.Reserve(config.port)) {
      return fail(ErrorKind::kPortExhaustion,
                  "Port " + std::to_string(config.port) + " is not available");
    }
    port = config.port;
  } else {
    auto acquired = ports_.Acquire();
    if (!acquired) {
      return fail(ErrorKind::kPortExhaustion,
                  "No free port in range " +
                      std::to_string(options_.port_first) + "-" +
                      std::to_string(options_.port_last));
    }
    port = *acquired;
  }

  // 5. Build the argument list.
  ServerConfig effective = config;
  effective.model_path = model_path;
  effective.port = port;
  if (effective.host.empty()) {
    effective.host = options_.host;
  }
  auto args = BuildServerArgs(effective);
  if (!args.ok) {
    ports_.Release(port);
    return fail(ErrorKind::kConfiguration,
                "Invalid server config: " + args.error);
  }

  // 6. Spawn.
  LaunchRequest launch;
  launch.executable = *executable;
  launch.args = args.args;
  if (!effective.api_key.empty()) {
    launch.env["LLAMA_API_KEY"] = effective.api_key;
  }
  if (auto lib_dir = catalog_->LibrarySearchPath(resolved_backend)) {
    const char *var = LibrarySearchVariable(catalog_->platform());
    const char *current = std::getenv(var);
    const char separator = catalog_->platform().os == "Windows" ? ';' : ':';
    launch.env[var] = lib_dir->string() +
                    (current && *current ? separator + std::string(current)
                                         : std::string());
  }

  log::Info("orchestrator", "starting llama-server",
            "model=" + model_id + " port=" + std::to_string(port) +
                " backend=" + resolved_backend + " exe=" +
                executable->string());
  const auto spawn_time = Clock::now();
  std::string launch_error;
  std::unique_ptr<ServerProcess> process = launcher_->Launch(launch, launch_error);
  if (!process) {
    ports_.Release(port);
    return fail(ErrorKind::kConfiguration,
                "Failed to start server: " + launch_error);
  }

  // 7. Wait for /health.
  const auto deadline = spawn_time + options_.startup_timeout;
  bool healthy = false;
  std::string exit_note;
  while (Clock::now() < deadline) {
    if (!process->IsRunning()) {
      auto status = process->ExitStatus();
      exit_note = "exited with status " + std::to_string(status ? *status : -1);
      break;
    }
    if (Probe(effective.host, port, options_.startup_probe_timeout)) {
      healthy = true;
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    std::this_thread::sleep_for(std::min(options_.probe_interval, remaining));
  }

  if (!healthy) {
    process->Kill();
    const std::string tail = process->StderrTail(options_.stderr_tail_bytes);
    ports_.Release(port);
    const auto timeout_s = std::chrono::duration_cast<std::chrono::seconds>(
                               options_.startup_timeout)
                               .count();
    std::string message =
        exit_note.empty()
            ? "Server failed to start within " + std::to_string(timeout_s) +
                  "s"
            : "Server " + exit_note + " during startup";
    message += ". Stderr: " + tail;
    auto result = fail(ErrorKind::kStartupTimeout, message);
    result.stderr_tail = tail;
    return result;
  }

  // 8. Register and persist.
  ServerInstance instance;
  instance.model_id = model_id;
  instance.model_path = model_path;
  instance.host = effective.host;
  instance.port = port;
  instance.pid = process->pid();
  instance.status = ServerStatus::kRunning;
  instance.backend_id = resolved_backend;
  instance.started_at = IsoTimestampNow();
  instance.last_healthy = instance.started_at;
  instance.context_size = effective.context_size;
  instance.gpu_layers = effective.gpu_layers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry &entry = servers_[model_id];
    entry.instance = instance;
    entry.process = std::move(process);
    entry.api_key = effective.api_key;
    entry.healthy_at = Clock::now();
    PersistLocked();
  }

  const double startup_s =
      std::chrono::duration<double>(Clock::now() - spawn_time).count();
  if (metrics_) {
    metrics_->RecordServerStart(resolved_backend, startup_s);
  }
  log::Info("orchestrator", "llama-server ready",
            "model=" + model_id + " port=" + std::to_string(port) +
                " pid=" + std::to_string(instance.pid));

  StartResult result;
  result.ok = true;
  result.instance = instance;
  result.message = "Server started on port " + std::to_string(port);
  return result;
}

StopResult ServerOrchestrator::Stop(const std::string &model_id) {
  KeyedMutex::Guard start_lock(start_locks_, model_id);

  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(model_id);
    if (it == servers_.end()) {
      return Fail<StopResult>(ErrorKind::kNotFound,
                              "Server not running for model " + model_id);
    }
    entry = std::move(it->second);
    servers_.erase(it);
    PersistLocked();
  }

  StopResult result;
  result.graceful = true;
  if (entry.process) {
    result.graceful = entry.process->Terminate(options_.stop_grace);
  }
  // The handle is the primary path; the pid covers a lost or stuck handle.
  if (!entry.process || entry.process->IsRunning()) {
    launcher_->KillPid(entry.instance.pid);
  }
  entry.process.reset();
  ports_.Release(entry.instance.port);
  if (metrics_) {
    metrics_->RecordServerStop();
  }
  log::Info("orchestrator", "stopped llama-server",
            "model=" + model_id + " port=" + std::to_string(entry.instance.port) +
                (result.graceful ? "" : " forced=true"));
  NotifyRemoved(model_id);
  result.ok = true;
  result.message = "Server stopped";
  return result;
}

void ServerOrchestrator::StopAll() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[model_id, entry] : servers_) {
      ids.push_back(model_id);
    }
  }
  for (const auto &model_id : ids) {
    Stop(model_id);
  }
}

std::vector<ServerInstance> ServerOrchestrator::ListRunning() {
  std::vector<ServerInstance> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[model_id, entry] : servers_) {
      snapshot.push_back(entry.instance);
    }
  }
  std::vector<ServerInstance> alive;
  for (const auto &instance : snapshot) {
    if (Probe(instance.host, instance.port, options_.health_timeout)) {
      MarkHealthy(instance.model_id, instance.pid);
      if (auto current = GetServer(instance.model_id)) {
        alive.push_back(*current);
      }
    } else {
      Evict(instance.model_id, instance.pid);
    }
  }
  return alive;
}

bool ServerOrchestrator::IsAlive(const std::string &model_id) {
  auto target = Lookup(model_id);
  if (!target) {
    return false;
  }
  const auto &instance = target->instance;
  if (Probe(instance.host, instance.port, options_.health_timeout)) {
    MarkHealthy(model_id, instance.pid);
    return true;
  }
  Evict(model_id, instance.pid);
  return false;
}

ProxyResult ServerOrchestrator::Request(const std::string &model_id,
                                        const std::string &method,
                                        const std::string &path,
                                        const json *body,
                                        std::chrono::milliseconds timeout,
                                        const std::string &operation) {
  auto target = Lookup(model_id);
  if (!target) {
    return Fail<ProxyResult>(ErrorKind::kNotFound,
                             "Server not running for model " + model_id);
  }
  const std::string url = target->instance.BaseUrl() + path;
  const auto headers = AuthHeaders(target->api_key);
  auto transport_error = [&](const std::string &message, int status) {
    if (metrics_) {
      metrics_->RecordProxyError(operation);
    }
    log::Debug("orchestrator", operation + " failed", message);
    auto result = Fail<ProxyResult>(ErrorKind::kTransport, message);
    result.http_status = status;
    return result;
  };

  const auto start = Clock::now();
  HttpResponse response;
  try {
    response = method == "GET"
                   ? client_.Get(url, headers, timeout)
                   : client_.Post(url, body ? body->dump() : "{}", headers,
                                  timeout);
  } catch (const std::exception &ex) {
    return transport_error(ex.what(), 0);
  }
  if (!response.Ok()) {
    return transport_error("HTTP " + std::to_string(response.status) + ": " +
                               Excerpt(response.body),
                           response.status);
  }

  ProxyResult result;
  result.http_status = response.status;
  result.latency_ms = ElapsedMs(start);
  try {
    result.body = response.body.empty() ? json::object()
                                        : json::parse(response.body);
  } catch (const json::parse_error &) {
    return transport_error("invalid JSON from " + path + ": " +
                               Excerpt(response.body, 120),
                           response.status);
  }
  result.ok = true;
  if (metrics_) {
    metrics_->RecordProxyRequest(operation, result.latency_ms);
  }
  return result;
}

StreamResult ServerOrchestrator::StreamRequest(const std::string &model_id,
                                               const std::string &path,
                                               json request,
                                               const ChunkCallback &on_chunk,
                                               const std::string &operation) {
  auto target = Lookup(model_id);
  if (!target) {
    return Fail<StreamResult>(ErrorKind::kNotFound,
                              "Server not running for model " + model_id);
  }
  request["stream"] = true;

  SseParser parser(on_chunk);
  int status = 0;
  bool http_ok = false;
  std::string error_body;

  HttpClient::StreamHandlers handlers;
  handlers.on_headers = [&](int code, const HttpHeaders &) {
    status = code;
    http_ok = code >= 200 && code < 300;
    return true;
  };
  handlers.on_body = [&](const char *data, std::size_t length) {
    if (!http_ok) {
      if (error_body.size() < 4096) {
        error_body.append(data, length);
      }
      return true;
    }
    return parser.Feed(data, length);
  };

  auto transport_error = [&](const std::string &message) {
    if (metrics_) {
      metrics_->RecordProxyError(operation);
    }
    auto result = Fail<StreamResult>(ErrorKind::kTransport, message);
    result.http_status = status;
    result.chunks = parser.chunks_delivered();
    result.skipped = parser.chunks_skipped();
    return result;
  };

  const auto start = Clock::now();
  try {
    client_.Stream("POST", target->instance.BaseUrl() + path, request.dump(),
                   AuthHeaders(target->api_key), options_.generation_timeout,
                   handlers);
  } catch (const std::exception &ex) {
    return transport_error(ex.what());
  }
  if (!http_ok) {
    return transport_error("HTTP " + std::to_string(status) + ": " +
                           Excerpt(error_body));
  }
  parser.Finish();
  if (parser.state() == SseParser::State::kError) {
    return transport_error("server reported: " + parser.error());
  }

  StreamResult result;
  result.ok = true;
  result.http_status = status;
  result.chunks = parser.chunks_delivered();
  result.skipped = parser.chunks_skipped();
  result.done = parser.state() == SseParser::State::kDone;
  result.stopped = parser.state() == SseParser::State::kStopped;
  if (metrics_) {
    metrics_->RecordProxyRequest(operation, ElapsedMs(start));
  }
  return result;
}

ProxyResult ServerOrchestrator::Completion(const std::string &model_id,
                                           const json &request) {
  json body = request;
  body["stream"] = false;
  return Request(model_id, "POST", "/v1/completions", &body,
                 options_.generation_timeout, "completion");
}

ProxyResult ServerOrchestrator::ChatCompletion(const std::string &model_id,
                                               const json &request) {
  json body = request;
  body["stream"] = false;
  return Request(model_id, "POST", "/v1/chat/completions", &body,
                 options_.generation_timeout, "chat");
}

StreamResult ServerOrchestrator::CompletionStream(const std::string &model_id,
                                                  const json &request,
                                                  const ChunkCallback &on_chunk) {
  return StreamRequest(model_id, "/v1/completions", request, on_chunk,
                       "completion_stream");
}

StreamResult
ServerOrchestrator::ChatCompletionStream(const std::string &model_id,
                                         const json &request,
                                         const ChunkCallback &on_chunk) {
  return StreamRequest(model_id, "/v1/chat/completions", request, on_chunk,
                       "chat_stream");
}

ProxyResult ServerOrchestrator::Embeddings(const std::string &model_id,
                                           const json &input) {
  json body = {{"input", input}};
  return Request(model_id, "POST", "/v1/embeddings", &body,
                 options_.embeddings_timeout, "embeddings");
}

TokenizeResult ServerOrchestrator::TokenizeCount(const std::string &model_id,
                                                 const std::string &text) {
  auto estimate = [&text](const std::string &why) {
    TokenizeResult result;
    result.ok = true;
    result.count = static_cast<int>(text.size() / 4);
    result.estimated = true;
    result.message = why;
    return result;
  };

  json body = {{"content", text}};
  auto response = Request(model_id, "POST", "/tokenize", &body,
                          options_.info_timeout, "tokenize");
  if (response.ok) {
    const json tokens = response.body.is_object()
                            ? response.body.value("tokens", json())
                            : json();
    if (tokens.is_array()) {
      TokenizeResult result;
      result.ok = true;
      result.count = static_cast<int>(tokens.size());
      return result;
    }
    return estimate("tokenize response has no tokens array");
  }
  if (response.error == ErrorKind::kNotFound) {
    return Fail<TokenizeResult>(response.error, response.message);
  }
  if (response.http_status == 404 || response.http_status == 405 ||
      response.http_status == 501) {
    return estimate("tokenize endpoint not available");
  }
  if (response.http_status == 0 && IsAlive(model_id)) {
    return estimate("tokenize request failed: " + response.message);
  }
  return Fail<TokenizeResult>(ErrorKind::kTransport, response.message);
}

ProxyResult ServerOrchestrator::Health(const std::string &model_id) {
  return Request(model_id, "GET", "/health", nullptr, options_.health_timeout,
                 "health");
}

ProxyResult ServerOrchestrator::Info(const std::string &model_id) {
  auto result =
      Request(model_id, "GET", "/info", nullptr, options_.info_timeout, "info");
  if (result.ok || result.http_status == 0) {
    return result;
  }
  // Older llama-server builds only expose /props.
  return Request(model_id, "GET", "/props", nullptr, options_.info_timeout,
                 "info");
}

MetricsResult ServerOrchestrator::Metrics(const std::string &model_id) {
  auto target = Lookup(model_id);
  if (!target) {
    return Fail<MetricsResult>(ErrorKind::kNotFound,
                               "Server not running for model " + model_id);
  }
  try {
    auto response = client_.Get(target->instance.BaseUrl() + "/metrics",
                                AuthHeaders(target->api_key),
                                options_.health_timeout);
    if (response.Ok()) {
      MetricsResult result;
      result.ok = true;
      result.prometheus = response.body;
      return result;
    }
  } catch (const std::exception &ex) {
    log::Debug("orchestrator", "metrics endpoint failed", ex.what());
  }
  // llama-server only serves /metrics when started with --metrics.
  auto health = Health(model_id);
  if (!health.ok) {
    return Fail<MetricsResult>(health.error, health.message);
  }
  MetricsResult result;
  result.ok = true;
  result.health = health.body;
  result.from_health = true;
  return result;
}

ProxyResult ServerOrchestrator::ListModels(const std::string &model_id) {
  return Request(model_id, "GET", "/v1/models", nullptr, options_.info_timeout,
                 "models");
}

} // namespace infergate
