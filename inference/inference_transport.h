#pragma once

#include "inference/inference_types.h"

#include <string>
#include <vector>

namespace infergate {

class ServerOrchestrator;

// One calling convention for a loaded model. The facade serializes calls, so
// implementations need not be thread-safe for generation.
//
// Streaming calls deliver deltas through `on_delta` and return the
// accumulated result once the stream has ended.
class InferenceTransport {
public:
  virtual ~InferenceTransport() = default;

  virtual LoadMode mode() const = 0;

  virtual GenerationResult Complete(const std::string &prompt,
                                    const SamplingParams &params) = 0;
  virtual GenerationResult Chat(const std::vector<ChatMessage> &messages,
                                const SamplingParams &params) = 0;
  virtual GenerationResult StreamComplete(const std::string &prompt,
                                          const SamplingParams &params,
                                          const DeltaCallback &on_delta) = 0;
  virtual GenerationResult StreamChat(const std::vector<ChatMessage> &messages,
                                      const SamplingParams &params,
                                      const DeltaCallback &on_delta) = 0;

  // False once the backing server or process is gone.
  virtual bool IsAlive() = 0;
  // Releases the backing server or process. Safe to call twice.
  virtual void Shutdown() = 0;
};

// Talks to a llama-server owned by the orchestrator.
class ServerTransport : public InferenceTransport {
public:
  ServerTransport(ServerOrchestrator &orchestrator, std::string model_id);

  LoadMode mode() const override { return LoadMode::kServerBacked; }

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
  void Shutdown() override;

private:
  ServerOrchestrator &orchestrator_;
  std::string model_id_;
  bool shut_down_{false};
};

// Reads the first choice and usage of an OpenAI-style reply. `chat` selects
// message.content over text.
GenerationResult ParseOpenAiReply(const nlohmann::json &reply, bool chat);

} // namespace infergate
