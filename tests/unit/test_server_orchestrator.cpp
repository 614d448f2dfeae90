#include <catch2/catch.hpp>

#include "backends/backend_catalog.h"
#include "metrics/metrics.h"
#include "orchestrator/server_orchestrator.h"
#include "test_fixtures.h"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace infergate;
using infergate_test::FastOptions;
using infergate_test::InstallFakeBackend;
using infergate_test::TempDir;
using infergate_test::WriteModelFile;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Launcher that records KillPid calls instead of signalling real pids.
// ---------------------------------------------------------------------------

class RecordingLauncher : public ProcessLauncher {
public:
  std::unique_ptr<ServerProcess> Launch(const LaunchRequest &launch,
                                        std::string &error) override {
    {
      std::lock_guard<std::mutex> lock(mutex);
      launches.push_back(launch);
    }
    return real.Launch(launch, error);
  }

  bool KillPid(int pid) override {
    std::lock_guard<std::mutex> lock(mutex);
    killed.push_back(pid);
    return true;
  }

  PosixProcessLauncher real;
  std::mutex mutex;
  std::vector<LaunchRequest> launches;
  std::vector<int> killed;
};

// ---------------------------------------------------------------------------
// Fixture: a backends dir with the fake server installed as "cpu" plus a
// models dir.
// ---------------------------------------------------------------------------

struct OrchestratorFixture {
  explicit OrchestratorFixture(int port_first, int port_last = 0)
      : catalog(dir / "backends", dir / "downloads", nullptr,
                HostPlatform{"Linux", "x64"}),
        options(FastOptions(dir, port_first,
                            port_last ? port_last : port_first + 9)) {
    InstallFakeBackend(dir / "backends", "cpu");
  }

  std::string Model(const std::string &name) {
    return WriteModelFile(dir / "models", name + ".gguf").string();
  }

  TempDir dir;
  BackendCatalog catalog;
  OrchestratorOptions options;
};

// ---------------------------------------------------------------------------
// [orchestrator] lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("Orchestrator starts a server and persists it", "[orchestrator]") {
  OrchestratorFixture fx(18400);
  MetricsRegistry metrics;
  ServerOrchestrator orch(&fx.catalog, fx.options, nullptr, &metrics);

  auto started = orch.Start("llama3", fx.Model("llama3"), ServerConfig{});
  REQUIRE(started.ok);
  REQUIRE_FALSE(started.already_running);
  REQUIRE(started.instance.port >= 18400);
  REQUIRE(started.instance.pid > 0);
  REQUIRE(started.instance.backend_id == "cpu");
  REQUIRE(started.instance.status == ServerStatus::kRunning);
  REQUIRE(orch.ports().IsReserved(started.instance.port));

  auto persisted = ServerStateStore(fx.options.state_file).Load();
  REQUIRE(persisted.count("llama3") == 1u);
  REQUIRE(persisted.at("llama3").pid == started.instance.pid);

  REQUIRE(orch.IsAlive("llama3"));
  REQUIRE(orch.ListRunning().size() == 1u);
  REQUIRE(metrics.RenderPrometheus().find(
              "infergate_server_starts_total{backend=\"cpu\"} 1") !=
          std::string::npos);

  auto stopped = orch.Stop("llama3");
  REQUIRE(stopped.ok);
  REQUIRE(stopped.graceful);
  REQUIRE_FALSE(orch.ports().IsReserved(started.instance.port));
  REQUIRE_FALSE(orch.GetServer("llama3").has_value());
  REQUIRE(ServerStateStore(fx.options.state_file).Load().empty());
}

TEST_CASE("Orchestrator Start is idempotent", "[orchestrator]") {
  OrchestratorFixture fx(18410);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  const auto model = fx.Model("llama3");

  auto first = orch.Start("llama3", model, ServerConfig{});
  auto second = orch.Start("llama3", model, ServerConfig{});
  REQUIRE(first.ok);
  REQUIRE(second.ok);
  REQUIRE(second.already_running);
  REQUIRE(second.instance.port == first.instance.port);
  REQUIRE(second.instance.pid == first.instance.pid);
}

TEST_CASE("Concurrent starts of one model spawn a single server",
          "[orchestrator]") {
  OrchestratorFixture fx(18420);
  auto launcher = std::make_shared<RecordingLauncher>();
  ServerOrchestrator orch(&fx.catalog, fx.options, launcher);
  const auto model = fx.Model("llama3");

  std::vector<StartResult> results(4);
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i] {
      results[i] = orch.Start("llama3", model, ServerConfig{});
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  std::set<int> ports;
  int fresh = 0;
  for (const auto &r : results) {
    REQUIRE(r.ok);
    ports.insert(r.instance.port);
    fresh += r.already_running ? 0 : 1;
  }
  REQUIRE(ports.size() == 1u);
  REQUIRE(fresh == 1);
  REQUIRE(launcher->launches.size() == 1u);
  REQUIRE(orch.ports().Reserved().size() == 1u);
}

TEST_CASE("Servers for different models get disjoint ports",
          "[orchestrator]") {
  OrchestratorFixture fx(18430);
  ServerOrchestrator orch(&fx.catalog, fx.options);

  auto a = orch.Start("alpha", fx.Model("alpha"), ServerConfig{});
  auto b = orch.Start("beta", fx.Model("beta"), ServerConfig{});
  REQUIRE(a.ok);
  REQUIRE(b.ok);
  REQUIRE(a.instance.port != b.instance.port);
  REQUIRE(orch.ListRunning().size() == 2u);

  orch.StopAll();
  REQUIRE(orch.ports().Reserved().empty());
  REQUIRE(orch.ListRunning().empty());
}

TEST_CASE("Orchestrator honours an explicit port", "[orchestrator]") {
  OrchestratorFixture fx(18440);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  ServerConfig config;
  config.port = 18445;

  auto started = orch.Start("llama3", fx.Model("llama3"), config);
  REQUIRE(started.ok);
  REQUIRE(started.instance.port == 18445);

  auto clash = orch.Start("other", fx.Model("other"), config);
  REQUIRE_FALSE(clash.ok);
  REQUIRE(clash.error == ErrorKind::kPortExhaustion);
}

TEST_CASE("Orchestrator reports port exhaustion", "[orchestrator]") {
  OrchestratorFixture fx(18450, 18450);
  ServerOrchestrator orch(&fx.catalog, fx.options);

  REQUIRE(orch.Start("first", fx.Model("first"), ServerConfig{}).ok);
  auto second = orch.Start("second", fx.Model("second"), ServerConfig{});
  REQUIRE_FALSE(second.ok);
  REQUIRE(second.error == ErrorKind::kPortExhaustion);
}

TEST_CASE("Orchestrator rejects missing backends and model files",
          "[orchestrator]") {
  OrchestratorFixture fx(18460);
  ServerOrchestrator orch(&fx.catalog, fx.options);

  auto no_model = orch.Start("ghost", (fx.dir / "ghost.gguf").string(),
                             ServerConfig{});
  REQUIRE_FALSE(no_model.ok);
  REQUIRE(no_model.error == ErrorKind::kConfiguration);
  REQUIRE(no_model.message.find("Model file not found") != std::string::npos);

  auto no_backend =
      orch.Start("llama3", fx.Model("llama3"), ServerConfig{}, "vulkan");
  REQUIRE_FALSE(no_backend.ok);
  REQUIRE(no_backend.error == ErrorKind::kConfiguration);

  ServerOrchestrator bare(nullptr, FastOptions(fx.dir, 18465, 18469));
  REQUIRE(bare.Start("llama3", fx.Model("llama3"), ServerConfig{}).error ==
          ErrorKind::kConfiguration);
  REQUIRE(orch.ports().Reserved().empty());
}

TEST_CASE("Startup failure carries the server's stderr", "[orchestrator]") {
  OrchestratorFixture fx(18470);
  MetricsRegistry metrics;
  ServerOrchestrator orch(&fx.catalog, fx.options, nullptr, &metrics);

  auto crashed = orch.Start("broken", fx.Model("crash-model"), ServerConfig{});
  REQUIRE_FALSE(crashed.ok);
  REQUIRE(crashed.error == ErrorKind::kStartupTimeout);
  REQUIRE(crashed.message.find("exited with status 1") != std::string::npos);
  REQUIRE(crashed.message.find("Stderr:") != std::string::npos);
  REQUIRE(crashed.stderr_tail.find("failed to load model") !=
          std::string::npos);
  REQUIRE(orch.ports().Reserved().empty());
  REQUIRE_FALSE(orch.GetServer("broken").has_value());
  REQUIRE(metrics.RenderPrometheus().find(
              "infergate_server_start_failures_total{reason=\"startup_timeout\"} 1") !=
          std::string::npos);
}

TEST_CASE("A server that never becomes healthy is killed", "[orchestrator]") {
  OrchestratorFixture fx(18480);
  fx.options.startup_timeout = std::chrono::milliseconds(1500);
  ServerOrchestrator orch(&fx.catalog, fx.options);

  const auto begin = std::chrono::steady_clock::now();
  auto hung = orch.Start("stuck", fx.Model("hang-model"), ServerConfig{});
  const auto waited = std::chrono::steady_clock::now() - begin;

  REQUIRE_FALSE(hung.ok);
  REQUIRE(hung.error == ErrorKind::kStartupTimeout);
  REQUIRE(hung.message.find("failed to start within") != std::string::npos);
  REQUIRE(hung.stderr_tail.find("loading model") != std::string::npos);
  REQUIRE(waited < std::chrono::seconds(5));
  REQUIRE(orch.ports().Reserved().empty());
}

TEST_CASE("Stop frees the port even after the process died",
          "[orchestrator]") {
  OrchestratorFixture fx(18490);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  auto started = orch.Start("llama3", fx.Model("llama3"), ServerConfig{});
  REQUIRE(started.ok);

  ::kill(started.instance.pid, SIGKILL);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  auto stopped = orch.Stop("llama3");
  REQUIRE(stopped.ok);
  REQUIRE_FALSE(orch.ports().IsReserved(started.instance.port));

  auto again = orch.Stop("llama3");
  REQUIRE_FALSE(again.ok);
  REQUIRE(again.error == ErrorKind::kNotFound);
}

TEST_CASE("A dead server is evicted by the next probe", "[orchestrator]") {
  OrchestratorFixture fx(18500);
  MetricsRegistry metrics;
  ServerOrchestrator orch(&fx.catalog, fx.options, nullptr, &metrics);
  auto started = orch.Start("llama3", fx.Model("llama3"), ServerConfig{});
  REQUIRE(started.ok);

  ::kill(started.instance.pid, SIGKILL);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  REQUIRE_FALSE(orch.IsAlive("llama3"));
  REQUIRE_FALSE(orch.GetServer("llama3").has_value());
  REQUIRE_FALSE(orch.ports().IsReserved(started.instance.port));
  REQUIRE(metrics.RenderPrometheus().find(
              "infergate_server_evictions_total 1") != std::string::npos);

  // A later Start brings up a fresh server.
  auto restarted = orch.Start("llama3", fx.Model("llama3"), ServerConfig{});
  REQUIRE(restarted.ok);
  REQUIRE_FALSE(restarted.already_running);
  REQUIRE(restarted.instance.pid != started.instance.pid);
}

TEST_CASE("GetServer reports a stale server as unhealthy", "[orchestrator]") {
  OrchestratorFixture fx(18740);
  fx.options.health_staleness = std::chrono::milliseconds(200);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  auto started = orch.Start("llama3", fx.Model("llama3"), ServerConfig{});
  REQUIRE(started.ok);
  REQUIRE(orch.GetServer("llama3")->status == ServerStatus::kRunning);

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  REQUIRE(orch.GetServer("llama3")->status == ServerStatus::kUnhealthy);

  // A successful probe makes it running again.
  REQUIRE(orch.IsAlive("llama3"));
  auto probed = orch.GetServer("llama3");
  REQUIRE(probed->status == ServerStatus::kRunning);
  REQUIRE_FALSE(probed->last_healthy.empty());
}

TEST_CASE("The removal callback sees stops and evictions", "[orchestrator]") {
  OrchestratorFixture fx(18750);
  std::mutex removed_mutex;
  std::vector<std::string> removed;
  ServerOrchestrator orch(&fx.catalog, fx.options);
  orch.SetRemovalCallback([&](const std::string &model_id) {
    std::lock_guard<std::mutex> lock(removed_mutex);
    removed.push_back(model_id);
  });

  auto dead = orch.Start("llama3", fx.Model("llama3"), ServerConfig{});
  auto kept = orch.Start("phi3", fx.Model("phi3"), ServerConfig{});
  REQUIRE(dead.ok);
  REQUIRE(kept.ok);

  ::kill(dead.instance.pid, SIGKILL);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  auto running = orch.ListRunning();
  REQUIRE(running.size() == 1u);
  REQUIRE(running.front().model_id == "phi3");
  REQUIRE(removed == std::vector<std::string>{"llama3"});

  REQUIRE(orch.Stop("phi3").ok);
  REQUIRE(removed == std::vector<std::string>{"llama3", "phi3"});

  // Unknown ids are not reported.
  REQUIRE_FALSE(orch.Stop("phi3").ok);
  REQUIRE(removed.size() == 2u);
}

TEST_CASE("Stop escalates to SIGKILL for servers ignoring SIGTERM",
          "[orchestrator]") {
  OrchestratorFixture fx(18510);
  fx.options.stop_grace = std::chrono::milliseconds(300);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  auto started = orch.Start("stubborn", fx.Model("stubborn-model"),
                            ServerConfig{});
  REQUIRE(started.ok);

  auto stopped = orch.Stop("stubborn");
  REQUIRE(stopped.ok);
  REQUIRE_FALSE(stopped.graceful);
  REQUIRE(::kill(started.instance.pid, 0) != 0);
}

TEST_CASE("Orphans recorded by a previous run are killed on construction",
          "[orchestrator]") {
  OrchestratorFixture fx(18520);
  ServerInstance a;
  a.model_id = "old-a";
  a.pid = 999901;
  ServerInstance b;
  b.model_id = "old-b";
  b.pid = 999902;
  ServerInstance no_pid;
  no_pid.model_id = "never-started";
  REQUIRE(ServerStateStore(fx.options.state_file)
              .Save({{"old-a", a}, {"old-b", b}, {"never-started", no_pid}}));

  auto launcher = std::make_shared<RecordingLauncher>();
  MetricsRegistry metrics;
  ServerOrchestrator orch(&fx.catalog, fx.options, launcher, &metrics);

  REQUIRE(orch.orphans_killed() == 2);
  REQUIRE(launcher->killed == std::vector<int>{999901, 999902});
  REQUIRE_FALSE(std::filesystem::exists(fx.options.state_file));
  REQUIRE(metrics.RenderPrometheus().find("infergate_orphan_kills_total 2") !=
          std::string::npos);
}

// ---------------------------------------------------------------------------
// [orchestrator][proxy] HTTP surface
// ---------------------------------------------------------------------------

TEST_CASE("Orchestrator proxies completions and chat", "[orchestrator][proxy]") {
  OrchestratorFixture fx(18530);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  REQUIRE(orch.Start("llama3", fx.Model("llama3"), ServerConfig{}).ok);

  auto completion =
      orch.Completion("llama3", {{"prompt", "hi there"}, {"max_tokens", 8}});
  REQUIRE(completion.ok);
  REQUIRE(completion.http_status == 200);
  REQUIRE(completion.body["choices"][0]["text"] == "echo: hi there");
  REQUIRE(completion.body["max_tokens"] == 8);

  json messages = json::array({{{"role", "user"}, {"content", "ping"}}});
  auto chat = orch.ChatCompletion("llama3", {{"messages", messages}});
  REQUIRE(chat.ok);
  REQUIRE(chat.body["choices"][0]["message"]["content"] ==
          "Hello from llama3: ping");
  REQUIRE(chat.body["usage"]["completion_tokens"] == 4);

  auto missing = orch.Completion("nobody", {{"prompt", "x"}});
  REQUIRE_FALSE(missing.ok);
  REQUIRE(missing.error == ErrorKind::kNotFound);
}

TEST_CASE("Orchestrator streams chat deltas in order", "[orchestrator][proxy]") {
  OrchestratorFixture fx(18540);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  REQUIRE(orch.Start("llama3", fx.Model("llama3"), ServerConfig{}).ok);

  std::string text;
  std::string finish;
  json messages =
      json::array({{{"role", "user"}, {"content", "[garbage] one two three"}}});
  auto result = orch.ChatCompletionStream(
      "llama3", {{"messages", messages}}, [&](const json &chunk) {
        const auto &choice = chunk["choices"][0];
        if (choice.contains("delta") && choice["delta"].contains("content")) {
          text += choice["delta"]["content"].get<std::string>();
        }
        if (choice["finish_reason"].is_string()) {
          finish = choice["finish_reason"].get<std::string>();
        }
        return true;
      });

  REQUIRE(result.ok);
  REQUIRE(result.done);
  REQUIRE_FALSE(result.stopped);
  REQUIRE(result.skipped == 1u);
  REQUIRE(text == "Hello from llama3: [garbage] one two three");
  REQUIRE(finish == "stop");
}

TEST_CASE("A stream consumer can stop early", "[orchestrator][proxy]") {
  OrchestratorFixture fx(18550);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  REQUIRE(orch.Start("llama3", fx.Model("llama3"), ServerConfig{}).ok);

  int seen = 0;
  auto result = orch.CompletionStream(
      "llama3", {{"prompt", "a b c d e f"}},
      [&seen](const json &) { return ++seen < 2; });
  REQUIRE(result.ok);
  REQUIRE(result.stopped);
  REQUIRE_FALSE(result.done);
  REQUIRE(seen == 2);

  // The server is still usable afterwards.
  REQUIRE(orch.Completion("llama3", {{"prompt", "after"}}).ok);
}

TEST_CASE("TokenizeCount falls back to an estimate", "[orchestrator][proxy]") {
  OrchestratorFixture fx(18560);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  REQUIRE(orch.Start("llama3", fx.Model("llama3"), ServerConfig{}).ok);
  REQUIRE(orch.Start("legacy", fx.Model("notok-model"), ServerConfig{}).ok);

  auto exact = orch.TokenizeCount("llama3", "one two three");
  REQUIRE(exact.ok);
  REQUIRE_FALSE(exact.estimated);
  REQUIRE(exact.count == 3);

  const std::string text = "sixteen chars!!!";
  auto estimated = orch.TokenizeCount("legacy", text);
  REQUIRE(estimated.ok);
  REQUIRE(estimated.estimated);
  REQUIRE(estimated.count == static_cast<int>(text.size() / 4));

  REQUIRE(orch.TokenizeCount("nobody", text).error == ErrorKind::kNotFound);
}

TEST_CASE("Info falls back to /props and Metrics to /health",
          "[orchestrator][proxy]") {
  OrchestratorFixture fx(18570);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  ServerConfig config;
  config.context_size = 2048;
  REQUIRE(orch.Start("llama3", fx.Model("llama3"), config).ok);

  auto info = orch.Info("llama3");
  REQUIRE(info.ok);
  REQUIRE(info.body["default_generation_settings"]["n_ctx"] == 2048);

  auto metrics = orch.Metrics("llama3");
  REQUIRE(metrics.ok);
  REQUIRE(metrics.from_health);
  REQUIRE(metrics.health["status"] == "ok");

  ServerConfig with_metrics;
  with_metrics.extra_args = {"--metrics"};
  REQUIRE(orch.Start("observed", fx.Model("observed"), with_metrics).ok);
  auto prometheus = orch.Metrics("observed");
  REQUIRE(prometheus.ok);
  REQUIRE_FALSE(prometheus.from_health);
  REQUIRE(prometheus.prometheus.find("llamacpp:") != std::string::npos);
}

TEST_CASE("Orchestrator forwards the API key", "[orchestrator][proxy]") {
  OrchestratorFixture fx(18580);
  ServerOrchestrator orch(&fx.catalog, fx.options);
  ServerConfig config;
  config.api_key = "sekret";
  config.alias = "assistant";
  REQUIRE(orch.Start("secure", fx.Model("secure"), config).ok);

  auto models = orch.ListModels("secure");
  REQUIRE(models.ok);
  REQUIRE(models.body["data"][0]["id"] == "assistant");

  auto embeddings = orch.Embeddings("secure", json::array({"a", "b"}));
  REQUIRE(embeddings.ok);
  REQUIRE(embeddings.body["data"][0]["embedding"].size() == 3u);

  REQUIRE(orch.Health("secure").ok);
}

TEST_CASE("The API key reaches the server through its environment",
          "[orchestrator]") {
  OrchestratorFixture fx(18770);
  auto launcher = std::make_shared<RecordingLauncher>();
  ServerOrchestrator orch(&fx.catalog, fx.options, launcher);
  ServerConfig config;
  config.api_key = "sekret";
  REQUIRE(orch.Start("secure", fx.Model("secure"), config).ok);

  std::lock_guard<std::mutex> lock(launcher->mutex);
  REQUIRE(launcher->launches.size() == 1u);
  const auto &launch = launcher->launches.front();
  REQUIRE(launch.env.at("LLAMA_API_KEY") == "sekret");
  for (const auto &arg : launch.args) {
    REQUIRE(arg.find("sekret") == std::string::npos);
  }
}
