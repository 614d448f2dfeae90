#pragma once

#include "inference/chat_session.h"
#include "inference/inference_transport.h"
#include "inference/library_transport.h"
#include "inference/process_transport.h"
#include "inference/ticket_mutex.h"
#include "orchestrator/server_types.h"
#include "util/keyed_mutex.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace infergate {

class BackendCatalog;
class HardwareProfile;
class MetricsRegistry;
class ModelLocator;
class ServerOrchestrator;

struct FacadeOptions {
  // Executable speaking the legacy JSON-lines protocol. Required for
  // process-backed loads.
  std::filesystem::path legacy_worker;
  ProcessTransportOptions process;
};

struct LoadedModelStats {
  std::string model_id;
  std::string model_path;
  LoadMode mode{LoadMode::kServerBacked};
  std::string loaded_at; // ISO-8601
  double uptime_seconds{0.0};
  uint64_t request_count{0};
  uint64_t total_tokens_generated{0};
  InferenceConfig config;
  std::optional<ServerInstance> server; // server-backed models only
};

void to_json(nlohmann::json &j, const LoadedModelStats &stats);

// Public entry point: loads models behind one of three transports and runs
// requests against them.
//
// Requests against one model are served strictly in arrival order; requests
// against different models run in parallel. Unload waits for the request in
// flight. A server-backed model is dropped as soon as the orchestrator stops
// tracking its server.
//
// Misuse (a request against a model that is not loaded, an unknown session)
// throws std::invalid_argument. A load that fails throws std::runtime_error.
// Generation failures are reported through GenerationResult.
class InferenceFacade {
public:
  InferenceFacade(ServerOrchestrator &orchestrator, const ModelLocator &models,
                  const HardwareProfile &hardware,
                  const BackendCatalog *catalog = nullptr,
                  FacadeOptions options = {},
                  MetricsRegistry *metrics = nullptr);
  // Unloads every model.
  ~InferenceFacade();
  InferenceFacade(const InferenceFacade &) = delete;
  InferenceFacade &operator=(const InferenceFacade &) = delete;

  InferenceConfig DefaultConfig() const;
  void SetDefaultConfig(const InferenceConfig &config);
  // Recomputes the default config from the installed backends and returns it.
  InferenceConfig ReloadHardwareConfig();

  void SetEngineFactory(std::shared_ptr<InProcessEngineFactory> factory);

  // Idempotent: returns the existing model's stats when already loaded.
  LoadedModelStats Load(const std::string &model_id,
                        const std::optional<InferenceConfig> &config = {},
                        LoadMode mode = LoadMode::kServerBacked);
  // False when the model was not loaded.
  bool Unload(const std::string &model_id);
  void UnloadAll();
  bool IsLoaded(const std::string &model_id) const;
  std::vector<LoadedModelStats> LoadedModels() const;

  GenerationResult Complete(const std::string &model_id,
                            const std::string &prompt,
                            const SamplingParams &params = {});
  GenerationResult Chat(const std::string &model_id,
                        const std::vector<ChatMessage> &messages,
                        const SamplingParams &params = {});
  GenerationResult StreamComplete(const std::string &model_id,
                                  const std::string &prompt,
                                  const DeltaCallback &on_delta,
                                  const SamplingParams &params = {});
  GenerationResult StreamChat(const std::string &model_id,
                              const std::vector<ChatMessage> &messages,
                              const DeltaCallback &on_delta,
                              const SamplingParams &params = {});

  // ── Chat sessions ──
  ChatSession CreateSession(const std::string &model_id,
                            const std::string &system_prompt = "");
  std::optional<ChatSession> GetSession(const std::string &session_id) const;
  std::vector<ChatSession> ListSessions() const;
  bool DeleteSession(const std::string &session_id);
  // Appends the user turn, chats with the whole transcript and appends the
  // reply when generation succeeds.
  GenerationResult SendMessage(const std::string &session_id,
                               const std::string &content,
                               const SamplingParams &params = {});
  GenerationResult SendMessageStream(const std::string &session_id,
                                     const std::string &content,
                                     const DeltaCallback &on_delta,
                                     const SamplingParams &params = {});

private:
  struct LoadedModel {
    std::string model_id;
    std::string model_path;
    InferenceConfig config;
    LoadMode mode{LoadMode::kServerBacked};
    std::string loaded_at;
    std::chrono::steady_clock::time_point loaded_clock;
    std::atomic<uint64_t> request_count{0};
    std::atomic<uint64_t> total_tokens_generated{0};

    // Orders requests; held for the whole request or stream.
    TicketMutex mutex;
    // Guarded by `mutex`.
    std::unique_ptr<InferenceTransport> transport;
    bool unloaded{false};
  };

  using Dispatch = std::function<GenerationResult(InferenceTransport &,
                                                  const SamplingParams &)>;

  InferenceConfig ComputeHardwareConfig() const;
  void OnServerRemoved(const std::string &model_id);
  std::shared_ptr<LoadedModel> Find(const std::string &model_id) const;
  std::unique_ptr<InferenceTransport>
  OpenTransport(const std::string &model_id, const std::string &model_path,
                const InferenceConfig &config, LoadMode mode);
  GenerationResult Run(const std::string &model_id,
                       const SamplingParams &params, const Dispatch &dispatch);
  // Caller holds model.mutex.
  void ShutdownLocked(LoadedModel &model);
  void Forget(const std::shared_ptr<LoadedModel> &model);
  LoadedModelStats Stats(const LoadedModel &model) const;
  GenerationResult SendToSession(const std::string &session_id,
                                 const std::string &content,
                                 const DeltaCallback *on_delta,
                                 const SamplingParams &params);

  ServerOrchestrator &orchestrator_;
  const ModelLocator &models_;
  const HardwareProfile &hardware_;
  const BackendCatalog *catalog_;
  FacadeOptions options_;
  MetricsRegistry *metrics_;

  // Serializes Load and Unload per model id.
  KeyedMutex load_locks_;

  // Guards default_config_, engine_factory_ and loaded_.
  mutable std::mutex mutex_;
  InferenceConfig default_config_;
  std::shared_ptr<InProcessEngineFactory> engine_factory_;
  std::map<std::string, std::shared_ptr<LoadedModel>> loaded_;

  ChatSessionStore sessions_;
};

} // namespace infergate
