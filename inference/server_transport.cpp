#include "inference/inference_transport.h"

#include "logging/logger.h"
#include "orchestrator/server_orchestrator.h"

using json = nlohmann::json;

namespace infergate {

namespace {

std::string StringOrEmpty(const json &value) {
  return value.is_string() ? value.get<std::string>() : std::string();
}

// parent[key][field] as a string; empty when either level has another type.
std::string NestedString(const json &parent, const char *key,
                         const char *field) {
  auto it = parent.find(key);
  if (it == parent.end() || !it->is_object()) {
    return std::string();
  }
  auto value = it->find(field);
  return value == it->end() ? std::string() : StringOrEmpty(*value);
}

int IntOr(const json &object, const char *key, int fallback) {
  auto it = object.find(key);
  return it != object.end() && it->is_number_integer() ? it->get<int>()
                                                       : fallback;
}

void ReadUsage(const json &usage, GenerationResult &result) {
  if (!usage.is_object()) {
    return;
  }
  result.prompt_tokens = IntOr(usage, "prompt_tokens", result.prompt_tokens);
  result.completion_tokens =
      IntOr(usage, "completion_tokens", result.completion_tokens);
  result.total_tokens = IntOr(usage, "total_tokens",
                              result.prompt_tokens + result.completion_tokens);
}

GenerationResult FromProxyFailure(const OpStatus &status) {
  GenerationResult result;
  result.error = status.message;
  result.transport_error = status.error == ErrorKind::kTransport ||
                           status.error == ErrorKind::kNotFound;
  return result;
}

// Accumulates a streamed reply chunk by chunk.
class StreamCollector {
public:
  StreamCollector(bool chat, const DeltaCallback &on_delta)
      : chat_(chat), on_delta_(on_delta) {}

  bool operator()(const json &chunk) {
    if (!chunk.is_object()) {
      return true;
    }
    ReadUsage(chunk.value("usage", json()), result_);
    const auto &choices = chunk.value("choices", json::array());
    if (!choices.is_array() || choices.empty() ||
        !choices.front().is_object()) {
      return true;
    }
    const json &choice = choices.front();
    std::string delta = chat_ ? NestedString(choice, "delta", "content")
                              : StringOrEmpty(choice.value("text", json()));
    auto reason = StringOrEmpty(choice.value("finish_reason", json()));
    if (!reason.empty()) {
      result_.finish_reason = reason;
    }
    if (delta.empty()) {
      return true;
    }
    ++deltas_;
    result_.content += delta;
    return on_delta_ ? on_delta_(delta) : true;
  }

  GenerationResult Finish(const StreamResult &stream) {
    if (!stream.ok) {
      GenerationResult failed = FromProxyFailure(stream);
      failed.content = result_.content;
      return failed;
    }
    result_.ok = true;
    // Servers that omit usage in streams get one token per delta.
    if (result_.completion_tokens == 0) {
      result_.completion_tokens = deltas_;
      result_.total_tokens = result_.prompt_tokens + deltas_;
    }
    return result_;
  }

private:
  bool chat_;
  const DeltaCallback &on_delta_;
  GenerationResult result_;
  int deltas_{0};
};

json CompletionBody(const std::string &prompt, const SamplingParams &params) {
  json body = {{"prompt", prompt}};
  ApplySampling(params, body);
  return body;
}

json ChatBody(const std::vector<ChatMessage> &messages,
              const SamplingParams &params) {
  json body = {{"messages", MessagesToJson(messages)}};
  ApplySampling(params, body);
  return body;
}

} // namespace

GenerationResult ParseOpenAiReply(const json &reply, bool chat) {
  GenerationResult result;
  result.raw = reply;
  if (!reply.is_object()) {
    result.error = "reply is not a JSON object";
    return result;
  }
  const auto &choices = reply.value("choices", json::array());
  if (!choices.is_array() || choices.empty() ||
      !choices.front().is_object()) {
    result.error = "reply has no choices";
    return result;
  }
  const json &choice = choices.front();
  result.content = chat ? NestedString(choice, "message", "content")
                        : StringOrEmpty(choice.value("text", json()));
  result.finish_reason = StringOrEmpty(choice.value("finish_reason", json()));
  ReadUsage(reply.value("usage", json()), result);
  result.ok = true;
  return result;
}

ServerTransport::ServerTransport(ServerOrchestrator &orchestrator,
                                 std::string model_id)
    : orchestrator_(orchestrator), model_id_(std::move(model_id)) {}

GenerationResult ServerTransport::Complete(const std::string &prompt,
                                           const SamplingParams &params) {
  auto reply = orchestrator_.Completion(model_id_, CompletionBody(prompt, params));
  if (!reply.ok) {
    return FromProxyFailure(reply);
  }
  return ParseOpenAiReply(reply.body, false);
}

GenerationResult ServerTransport::Chat(const std::vector<ChatMessage> &messages,
                                       const SamplingParams &params) {
  auto reply =
      orchestrator_.ChatCompletion(model_id_, ChatBody(messages, params));
  if (!reply.ok) {
    return FromProxyFailure(reply);
  }
  return ParseOpenAiReply(reply.body, true);
}

GenerationResult
ServerTransport::StreamComplete(const std::string &prompt,
                                const SamplingParams &params,
                                const DeltaCallback &on_delta) {
  StreamCollector collector(false, on_delta);
  auto stream = orchestrator_.CompletionStream(
      model_id_, CompletionBody(prompt, params),
      [&collector](const json &chunk) { return collector(chunk); });
  return collector.Finish(stream);
}

GenerationResult
ServerTransport::StreamChat(const std::vector<ChatMessage> &messages,
                            const SamplingParams &params,
                            const DeltaCallback &on_delta) {
  StreamCollector collector(true, on_delta);
  auto stream = orchestrator_.ChatCompletionStream(
      model_id_, ChatBody(messages, params),
      [&collector](const json &chunk) { return collector(chunk); });
  return collector.Finish(stream);
}

bool ServerTransport::IsAlive() {
  return !shut_down_ && orchestrator_.IsAlive(model_id_);
}

void ServerTransport::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  auto stopped = orchestrator_.Stop(model_id_);
  if (!stopped.ok && stopped.error != ErrorKind::kNotFound) {
    log::Warn("facade", "stopping server failed",
              "model=" + model_id_ + " error=" + stopped.message);
  }
}

} // namespace infergate
