#pragma once

#include "net/http_client.h"
#include "orchestrator/port_allocator.h"
#include "orchestrator/server_config.h"
#include "orchestrator/server_process.h"
#include "orchestrator/server_state_store.h"
#include "orchestrator/server_types.h"
#include "util/keyed_mutex.h"

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
class MetricsRegistry;

struct OrchestratorOptions {
  std::string host{"127.0.0.1"};
  int port_first{8080};
  int port_last{8179};
  std::filesystem::path state_file;

  std::chrono::milliseconds startup_timeout{60000};
  std::chrono::milliseconds probe_interval{500};
  std::chrono::milliseconds startup_probe_timeout{2000};
  std::chrono::milliseconds stop_grace{10000};

  std::chrono::milliseconds health_timeout{5000};
  // A running server whose last successful probe is older than this is
  // reported as unhealthy until the next probe.
  std::chrono::milliseconds health_staleness{30000};
  std::chrono::milliseconds generation_timeout{120000};
  std::chrono::milliseconds embeddings_timeout{60000};
  std::chrono::milliseconds info_timeout{10000};

  // Bytes of server stderr quoted in startup failures.
  std::size_t stderr_tail_bytes{500};
};

// Runs one native llama-server per model id.
//
// Lifecycle per model id:
//   NONE -> STARTING -> RUNNING -> STOPPING -> NONE
//                       RUNNING -> DEAD (failed probe) -> NONE
//
// On construction every pid left in the state file by a previous run is
// killed and the file is removed. The destructor stops every server.
//
// Thread safety: all public methods are thread-safe. Start and Stop for the
// same model id are serialized by a per-id lock held for the whole sequence.
class ServerOrchestrator {
public:
  // Returns false to stop consuming a stream.
  using ChunkCallback = std::function<bool(const nlohmann::json &chunk)>;
  // Called with the model id after a server leaves the table, whether it was
  // stopped or evicted. Never called with internal locks held.
  using RemovalCallback = std::function<void(const std::string &model_id)>;

  ServerOrchestrator(const BackendCatalog *catalog, OrchestratorOptions options,
                     std::shared_ptr<ProcessLauncher> launcher = nullptr,
                     MetricsRegistry *metrics = nullptr);
  ~ServerOrchestrator();
  ServerOrchestrator(const ServerOrchestrator &) = delete;
  ServerOrchestrator &operator=(const ServerOrchestrator &) = delete;

  // Idempotent: a healthy server for `model_id` is returned unchanged with
  // already_running=true. An empty backend id uses the active backend.
  StartResult Start(const std::string &model_id, const std::string &model_path,
                    const ServerConfig &config,
                    const std::string &backend_id = "");

  // Always releases the port and forgets the id, even if the process had
  // already exited. NotFound when the id is not tracked.
  StopResult Stop(const std::string &model_id);
  void StopAll();

  // Probes every tracked server and evicts the ones that fail.
  std::vector<ServerInstance> ListRunning();
  // Tracked instance without probing. Status is kUnhealthy when the last
  // successful probe is older than health_staleness.
  std::optional<ServerInstance> GetServer(const std::string &model_id) const;
  // Probes one server; evicts it when the probe fails.
  bool IsAlive(const std::string &model_id);

  // ── HTTP surface proxied to a running server ──
  ProxyResult Completion(const std::string &model_id,
                         const nlohmann::json &request);
  ProxyResult ChatCompletion(const std::string &model_id,
                             const nlohmann::json &request);
  StreamResult CompletionStream(const std::string &model_id,
                                const nlohmann::json &request,
                                const ChunkCallback &on_chunk);
  StreamResult ChatCompletionStream(const std::string &model_id,
                                    const nlohmann::json &request,
                                    const ChunkCallback &on_chunk);
  // `input` is a string or an array of strings.
  ProxyResult Embeddings(const std::string &model_id,
                         const nlohmann::json &input);
  // Falls back to length/4 (estimated=true) when /tokenize is unsupported.
  TokenizeResult TokenizeCount(const std::string &model_id,
                               const std::string &text);
  ProxyResult Health(const std::string &model_id);
  ProxyResult Info(const std::string &model_id);
  MetricsResult Metrics(const std::string &model_id);
  ProxyResult ListModels(const std::string &model_id);

  // Replaces the removal callback; pass nullptr to clear it. Blocks while a
  // callback is running.
  void SetRemovalCallback(RemovalCallback callback);

  // Number of orphaned pids killed at construction.
  int orphans_killed() const { return orphans_killed_; }
  const OrchestratorOptions &options() const { return options_; }
  const PortAllocator &ports() const { return ports_; }

private:
  struct Entry {
    ServerInstance instance;
    std::unique_ptr<ServerProcess> process;
    std::string api_key;
    std::chrono::steady_clock::time_point healthy_at;
  };

  struct Target {
    ServerInstance instance;
    std::string api_key;
  };

  void CleanupOrphans();
  bool Probe(const std::string &host, int port,
             std::chrono::milliseconds timeout) const;
  // Removes the entry if it still belongs to `expected_pid`, kills its
  // process and frees the port.
  void Evict(const std::string &model_id, int expected_pid);
  void MarkHealthy(const std::string &model_id, int expected_pid);
  // Caller holds mutex_.
  void PersistLocked();
  std::optional<Target> Lookup(const std::string &model_id) const;
  void NotifyRemoved(const std::string &model_id);

  ProxyResult Request(const std::string &model_id, const std::string &method,
                      const std::string &path, const nlohmann::json *body,
                      std::chrono::milliseconds timeout,
                      const std::string &operation);
  StreamResult StreamRequest(const std::string &model_id,
                             const std::string &path, nlohmann::json request,
                             const ChunkCallback &on_chunk,
                             const std::string &operation);

  const BackendCatalog *catalog_;
  OrchestratorOptions options_;
  std::shared_ptr<ProcessLauncher> launcher_;
  MetricsRegistry *metrics_;
  HttpClient client_;
  PortAllocator ports_;
  ServerStateStore store_;
  int orphans_killed_{0};

  // Start and Stop for one model id hold its lock for the whole sequence.
  KeyedMutex start_locks_;

  // Guards servers_.
  mutable std::mutex mutex_;
  std::map<std::string, Entry> servers_;

  // Held while the callback runs so clearing it waits for the call.
  std::mutex removal_mutex_;
  RemovalCallback on_removed_;
};

} // namespace infergate
