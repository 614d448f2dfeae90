#pragma once

#include "inference/inference_transport.h"

#include <memory>
#include <string>

namespace infergate {

// An inference engine linked into the host application. infergate never links
// one itself; the host registers a factory with the facade.
class InProcessEngine {
public:
  virtual ~InProcessEngine() = default;
  // `on_delta` is empty for non-streaming calls.
  virtual GenerationResult Complete(const std::string &prompt,
                                    const SamplingParams &params,
                                    const DeltaCallback &on_delta) = 0;
  virtual GenerationResult Chat(const std::vector<ChatMessage> &messages,
                                const SamplingParams &params,
                                const DeltaCallback &on_delta) = 0;
  virtual void Unload() {}
};

class InProcessEngineFactory {
public:
  virtual ~InProcessEngineFactory() = default;
  // Returns nullptr and fills `error` when the model cannot be loaded.
  virtual std::unique_ptr<InProcessEngine>
  Create(const std::string &model_path, const InferenceConfig &config,
         std::string &error) = 0;
};

class LibraryTransport : public InferenceTransport {
public:
  explicit LibraryTransport(std::unique_ptr<InProcessEngine> engine);
  ~LibraryTransport() override;

  LoadMode mode() const override { return LoadMode::kLibraryBacked; }

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

  bool IsAlive() override { return engine_ != nullptr; }
  void Shutdown() override;

private:
  GenerationResult Unavailable() const;

  std::unique_ptr<InProcessEngine> engine_;
};

} // namespace infergate
