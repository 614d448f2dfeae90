#include "inference/library_transport.h"

namespace infergate {

LibraryTransport::LibraryTransport(std::unique_ptr<InProcessEngine> engine)
    : engine_(std::move(engine)) {}

LibraryTransport::~LibraryTransport() { Shutdown(); }

GenerationResult LibraryTransport::Unavailable() const {
  GenerationResult result;
  result.error = "engine has been unloaded";
  result.transport_error = true;
  return result;
}

GenerationResult LibraryTransport::Complete(const std::string &prompt,
                                            const SamplingParams &params) {
  if (!engine_) {
    return Unavailable();
  }
  return engine_->Complete(prompt, params, DeltaCallback());
}

GenerationResult
LibraryTransport::Chat(const std::vector<ChatMessage> &messages,
                       const SamplingParams &params) {
  if (!engine_) {
    return Unavailable();
  }
  return engine_->Chat(messages, params, DeltaCallback());
}

GenerationResult
LibraryTransport::StreamComplete(const std::string &prompt,
                                 const SamplingParams &params,
                                 const DeltaCallback &on_delta) {
  if (!engine_) {
    return Unavailable();
  }
  return engine_->Complete(prompt, params, on_delta);
}

GenerationResult
LibraryTransport::StreamChat(const std::vector<ChatMessage> &messages,
                             const SamplingParams &params,
                             const DeltaCallback &on_delta) {
  if (!engine_) {
    return Unavailable();
  }
  return engine_->Chat(messages, params, on_delta);
}

void LibraryTransport::Shutdown() {
  if (engine_) {
    engine_->Unload();
    engine_.reset();
  }
}

} // namespace infergate
