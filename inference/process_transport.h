#pragma once

#include "inference/inference_transport.h"
#include "orchestrator/child_process.h"

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <memory>

namespace infergate {

struct ProcessTransportOptions {
  std::chrono::milliseconds ready_timeout{60000};
  std::chrono::milliseconds request_timeout{120000};
  std::chrono::milliseconds stream_start_timeout{10000};
  std::chrono::milliseconds unload_timeout{5000};
};

// Legacy worker speaking JSON lines over stdin/stdout. The worker is started
// as `<worker> <model_path> <config_json>` and reports `loading` then `ready`
// (or `error`) before accepting requests.
class ProcessTransport : public InferenceTransport {
public:
  // Returns nullptr and fills `error` when the worker cannot be started or
  // never reports ready.
  static std::unique_ptr<ProcessTransport>
  Launch(const std::filesystem::path &worker, const std::string &model_path,
         const InferenceConfig &config, std::string &error,
         ProcessTransportOptions options = {});

  ~ProcessTransport() override;

  LoadMode mode() const override { return LoadMode::kProcessBacked; }

  GenerationResult Complete(const std::string &prompt,
                            const SamplingParams &params) override;
  GenerationResult Chat(const std::vector<ChatMessage> &messages,
                        const SamplingParams &params) override;
  GenerationResult StreamComplete(const std::string &prompt,
                                  const SamplingParams &params,
                                  const DeltaCallback &on_delta) override;
  GenerationResult StreamChat(const std::vector<ChatMessage> &messages,
                              const SamplingParams &params,
                              const DeltaCallback &on_delta) override;

  bool IsAlive() override;
  // Sends `unload`, then terminates the worker.
  void Shutdown() override;

  // Round-trips a `ping`.
  bool Ping();
  int pid() const { return child_->pid(); }

private:
  ProcessTransport(std::unique_ptr<ChildProcess> child,
                   ProcessTransportOptions options);

  // Reads JSON lines until one has a type in `accept` or is an error.
  // Returns a null json on timeout or EOF and fills `error`.
  nlohmann::json
  AwaitMessage(std::initializer_list<const char *> accept,
               std::chrono::milliseconds timeout, std::string &error);
  bool Send(const nlohmann::json &request, std::string &error);
  // Kills the worker after a timeout or EOF left the protocol out of step.
  GenerationResult Abandon(const std::string &error);
  GenerationResult Request(nlohmann::json request, bool chat);
  GenerationResult Stream(nlohmann::json request,
                          const DeltaCallback &on_delta);

  std::unique_ptr<ChildProcess> child_;
  ProcessTransportOptions options_;
  bool shut_down_{false};
};

} // namespace infergate
