#include "inference/inference_facade.h"

#include "backends/backend_catalog.h"
#include "logging/logger.h"
#include "metrics/metrics.h"
#include "orchestrator/server_orchestrator.h"
#include "registry/hardware_profile.h"
#include "registry/model_registry.h"
#include "util/time_format.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace infergate {

void to_json(json &j, const LoadedModelStats &stats) {
  j = json{{"model_id", stats.model_id},
           {"model_path", stats.model_path},
           {"inference_mode", LoadModeName(stats.mode)},
           {"loaded_at", stats.loaded_at},
           {"uptime_seconds", stats.uptime_seconds},
           {"request_count", stats.request_count},
           {"total_tokens_generated", stats.total_tokens_generated},
           {"config", stats.config}};
  if (stats.server) {
    j["server"] = *stats.server;
  }
}

InferenceFacade::InferenceFacade(ServerOrchestrator &orchestrator,
                                 const ModelLocator &models,
                                 const HardwareProfile &hardware,
                                 const BackendCatalog *catalog,
                                 FacadeOptions options,
                                 MetricsRegistry *metrics)
    : orchestrator_(orchestrator), models_(models), hardware_(hardware),
      catalog_(catalog), options_(std::move(options)), metrics_(metrics) {
  default_config_ = ComputeHardwareConfig();
  orchestrator_.SetRemovalCallback(
      [this](const std::string &model_id) { OnServerRemoved(model_id); });
}

InferenceFacade::~InferenceFacade() {
  orchestrator_.SetRemovalCallback(nullptr);
  UnloadAll();
}

void InferenceFacade::OnServerRemoved(const std::string &model_id) {
  // A request in flight keeps its own reference and fails on its own.
  std::shared_ptr<LoadedModel> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loaded_.find(model_id);
    if (it == loaded_.end() || it->second->mode != LoadMode::kServerBacked) {
      return;
    }
    dropped = std::move(it->second);
    loaded_.erase(it);
  }
  log::Info("facade", "model dropped with its server", "model=" + model_id);
}

InferenceConfig InferenceFacade::ComputeHardwareConfig() const {
  InferenceConfig config;
  std::string backend;
  if (catalog_) {
    if (auto active = catalog_->ActiveBackend()) {
      backend = active->id;
    }
  }
  if (backend.empty()) {
    backend = hardware_.RecommendedBackend();
  }
  if (backend.empty()) {
    // Nothing known about the host: offload everything and let the server
    // fall back to the CPU.
    config.gpu_layers = -1;
    return config;
  }
  const BackendTuning tuning = hardware_.TuningFor(backend);
  config.gpu_layers = tuning.gpu_layers;
  config.threads = tuning.threads;
  config.batch_size = tuning.batch_size;
  log::Debug("facade", "derived default config",
             "backend=" + backend +
                 " gpu_layers=" + std::to_string(config.gpu_layers) +
                 " threads=" + std::to_string(config.threads) +
                 " batch=" + std::to_string(config.batch_size));
  return config;
}

InferenceConfig InferenceFacade::DefaultConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_config_;
}

void InferenceFacade::SetDefaultConfig(const InferenceConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_config_ = config;
}

InferenceConfig InferenceFacade::ReloadHardwareConfig() {
  InferenceConfig config = ComputeHardwareConfig();
  std::lock_guard<std::mutex> lock(mutex_);
  default_config_ = config;
  return config;
}

void InferenceFacade::SetEngineFactory(
    std::shared_ptr<InProcessEngineFactory> factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  engine_factory_ = std::move(factory);
}

std::shared_ptr<InferenceFacade::LoadedModel>
InferenceFacade::Find(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loaded_.find(model_id);
  if (it == loaded_.end()) {
    throw std::invalid_argument("Model not loaded: " + model_id);
  }
  return it->second;
}

std::unique_ptr<InferenceTransport>
InferenceFacade::OpenTransport(const std::string &model_id,
                               const std::string &model_path,
                               const InferenceConfig &config, LoadMode mode) {
  switch (mode) {
  case LoadMode::kServerBacked: {
    auto started = orchestrator_.Start(
        model_id, model_path, config.ToServerConfig(model_path),
        config.backend_id);
    if (!started.ok) {
      throw std::runtime_error("Failed to start llama-server: " +
                               started.message);
    }
    log::Info("facade", "model loaded via llama-server",
              "model=" + model_id +
                  " port=" + std::to_string(started.instance.port));
    return std::make_unique<ServerTransport>(orchestrator_, model_id);
  }
  case LoadMode::kProcessBacked: {
    if (options_.legacy_worker.empty()) {
      throw std::runtime_error("No legacy worker configured");
    }
    std::string error;
    auto transport = ProcessTransport::Launch(
        options_.legacy_worker, model_path, config, error, options_.process);
    if (!transport) {
      throw std::runtime_error("Failed to start legacy worker: " + error);
    }
    return transport;
  }
  case LoadMode::kLibraryBacked: {
    std::shared_ptr<InProcessEngineFactory> factory;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      factory = engine_factory_;
    }
    if (!factory) {
      throw std::runtime_error("No in-process engine registered");
    }
    std::string error;
    auto engine = factory->Create(model_path, config, error);
    if (!engine) {
      throw std::runtime_error("Failed to load model in process: " + error);
    }
    return std::make_unique<LibraryTransport>(std::move(engine));
  }
  }
  throw std::invalid_argument("Unknown load mode");
}

LoadedModelStats InferenceFacade::Load(const std::string &model_id,
                                       const std::optional<InferenceConfig> &config,
                                       LoadMode mode) {
  KeyedMutex::Guard load_lock(load_locks_, model_id);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loaded_.find(model_id);
    if (it != loaded_.end()) {
      return Stats(*it->second);
    }
  }

  auto path = models_.Resolve(model_id);
  if (!path) {
    throw std::invalid_argument("Model not found: " + model_id);
  }
  std::error_code ec;
  if (!fs::is_regular_file(*path, ec)) {
    throw std::runtime_error("Model file not found: " + path->string());
  }

  auto model = std::make_shared<LoadedModel>();
  model->model_id = model_id;
  model->model_path = path->string();
  model->config = config ? *config : DefaultConfig();
  model->mode = mode;
  model->transport =
      OpenTransport(model_id, model->model_path, model->config, mode);
  model->loaded_at = IsoTimestampNow();
  model->loaded_clock = std::chrono::steady_clock::now();

  std::lock_guard<std::mutex> lock(mutex_);
  loaded_[model_id] = model;
  return Stats(*model);
}

void InferenceFacade::ShutdownLocked(LoadedModel &model) {
  if (model.unloaded) {
    return;
  }
  model.unloaded = true;
  if (model.transport) {
    model.transport->Shutdown();
  }
}

void InferenceFacade::Forget(const std::shared_ptr<LoadedModel> &model) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loaded_.find(model->model_id);
  if (it != loaded_.end() && it->second == model) {
    loaded_.erase(it);
  }
}

bool InferenceFacade::Unload(const std::string &model_id) {
  KeyedMutex::Guard load_lock(load_locks_, model_id);

  std::shared_ptr<LoadedModel> model;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loaded_.find(model_id);
    if (it == loaded_.end()) {
      return false;
    }
    model = it->second;
  }
  {
    // Waits behind every request queued before the unload.
    std::lock_guard<TicketMutex> lock(model->mutex);
    ShutdownLocked(*model);
  }
  Forget(model);
  log::Info("facade", "model unloaded", "model=" + model_id);
  return true;
}

void InferenceFacade::UnloadAll() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[model_id, model] : loaded_) {
      ids.push_back(model_id);
    }
  }
  for (const auto &model_id : ids) {
    Unload(model_id);
  }
}

bool InferenceFacade::IsLoaded(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loaded_.count(model_id) > 0;
}

LoadedModelStats InferenceFacade::Stats(const LoadedModel &model) const {
  LoadedModelStats stats;
  stats.model_id = model.model_id;
  stats.model_path = model.model_path;
  stats.mode = model.mode;
  stats.loaded_at = model.loaded_at;
  stats.uptime_seconds = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() -
                             model.loaded_clock)
                             .count();
  stats.request_count = model.request_count.load();
  stats.total_tokens_generated = model.total_tokens_generated.load();
  stats.config = model.config;
  if (model.mode == LoadMode::kServerBacked) {
    stats.server = orchestrator_.GetServer(model.model_id);
  }
  return stats;
}

std::vector<LoadedModelStats> InferenceFacade::LoadedModels() const {
  std::vector<std::shared_ptr<LoadedModel>> models;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[model_id, model] : loaded_) {
      models.push_back(model);
    }
  }
  std::vector<LoadedModelStats> out;
  out.reserve(models.size());
  for (const auto &model : models) {
    out.push_back(Stats(*model));
  }
  return out;
}

GenerationResult InferenceFacade::Run(const std::string &model_id,
                                      const SamplingParams &params,
                                      const Dispatch &dispatch) {
  auto model = Find(model_id);
  GenerationResult result;
  bool dropped = false;
  {
    std::lock_guard<TicketMutex> lock(model->mutex);
    if (model->unloaded) {
      throw std::invalid_argument("Model not loaded: " + model_id);
    }
    ++model->request_count;
    result =
        dispatch(*model->transport, ResolveSampling(params, model->config));
    if (result.ok) {
      model->total_tokens_generated +=
          static_cast<uint64_t>(std::max(0, result.completion_tokens));
      if (metrics_) {
        metrics_->RecordModelRequest(model_id, result.prompt_tokens,
                                     result.completion_tokens);
      }
    } else if (result.transport_error && !model->transport->IsAlive()) {
      // The backing server or worker is gone; the model goes with it.
      ShutdownLocked(*model);
      dropped = true;
    }
  }
  if (dropped) {
    Forget(model);
    log::Warn("facade", "dropped model after its backend died",
              "model=" + model_id + " error=" + result.error);
  }
  return result;
}

GenerationResult InferenceFacade::Complete(const std::string &model_id,
                                           const std::string &prompt,
                                           const SamplingParams &params) {
  return Run(model_id, params,
             [&prompt](InferenceTransport &transport,
                       const SamplingParams &resolved) {
               return transport.Complete(prompt, resolved);
             });
}

GenerationResult
InferenceFacade::Chat(const std::string &model_id,
                      const std::vector<ChatMessage> &messages,
                      const SamplingParams &params) {
  return Run(model_id, params,
             [&messages](InferenceTransport &transport,
                         const SamplingParams &resolved) {
               return transport.Chat(messages, resolved);
             });
}

GenerationResult InferenceFacade::StreamComplete(const std::string &model_id,
                                                 const std::string &prompt,
                                                 const DeltaCallback &on_delta,
                                                 const SamplingParams &params) {
  return Run(model_id, params,
             [&](InferenceTransport &transport,
                 const SamplingParams &resolved) {
               return transport.StreamComplete(prompt, resolved, on_delta);
             });
}

GenerationResult
InferenceFacade::StreamChat(const std::string &model_id,
                            const std::vector<ChatMessage> &messages,
                            const DeltaCallback &on_delta,
                            const SamplingParams &params) {
  return Run(model_id, params,
             [&](InferenceTransport &transport,
                 const SamplingParams &resolved) {
               return transport.StreamChat(messages, resolved, on_delta);
             });
}

ChatSession InferenceFacade::CreateSession(const std::string &model_id,
                                           const std::string &system_prompt) {
  if (model_id.empty()) {
    throw std::invalid_argument("model id is required");
  }
  return sessions_.Create(model_id, system_prompt);
}

std::optional<ChatSession>
InferenceFacade::GetSession(const std::string &session_id) const {
  return sessions_.Get(session_id);
}

std::vector<ChatSession> InferenceFacade::ListSessions() const {
  return sessions_.List();
}

bool InferenceFacade::DeleteSession(const std::string &session_id) {
  return sessions_.Delete(session_id);
}

GenerationResult InferenceFacade::SendToSession(const std::string &session_id,
                                                const std::string &content,
                                                const DeltaCallback *on_delta,
                                                const SamplingParams &params) {
  auto session = sessions_.Get(session_id);
  if (!session) {
    throw std::invalid_argument("Session not found: " + session_id);
  }
  auto history = sessions_.Append(session_id, {"user", content, ""});
  if (!history) {
    throw std::invalid_argument("Session not found: " + session_id);
  }
  GenerationResult result =
      on_delta ? StreamChat(session->model_id, *history, *on_delta, params)
               : Chat(session->model_id, *history, params);
  if (result.ok) {
    sessions_.Append(session_id, {"assistant", result.content, ""});
  }
  return result;
}

GenerationResult InferenceFacade::SendMessage(const std::string &session_id,
                                              const std::string &content,
                                              const SamplingParams &params) {
  return SendToSession(session_id, content, nullptr, params);
}

GenerationResult
InferenceFacade::SendMessageStream(const std::string &session_id,
                                   const std::string &content,
                                   const DeltaCallback &on_delta,
                                   const SamplingParams &params) {
  return SendToSession(session_id, content, &on_delta, params);
}

} // namespace infergate
