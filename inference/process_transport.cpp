#include "inference/process_transport.h"

#include "logging/logger.h"

#include <algorithm>

using json = nlohmann::json;

namespace infergate {

namespace {

GenerationResult TransportFailure(const std::string &message) {
  GenerationResult result;
  result.error = message;
  result.transport_error = true;
  return result;
}

std::string ErrorText(const json &message) {
  const auto &error = message.value("error", json());
  if (error.is_string()) {
    return error.get<std::string>();
  }
  if (error.is_object()) {
    return error.value("message", error.dump());
  }
  return message.value("message", std::string("worker reported an error"));
}

void ReadWorkerUsage(const json &message, GenerationResult &result) {
  const auto &usage = message.value("usage", json::object());
  if (!usage.is_object()) {
    return;
  }
  result.prompt_tokens = usage.value("prompt_tokens", 0);
  result.completion_tokens = usage.value("completion_tokens", 0);
  result.total_tokens = usage.value(
      "total_tokens", result.prompt_tokens + result.completion_tokens);
}

json SamplingFields(const SamplingParams &params) {
  json request = json::object();
  ApplySampling(params, request);
  return request;
}

} // namespace

std::unique_ptr<ProcessTransport>
ProcessTransport::Launch(const std::filesystem::path &worker,
                         const std::string &model_path,
                         const InferenceConfig &config, std::string &error,
                         ProcessTransportOptions options) {
  ChildOptions child_options;
  child_options.executable = worker;
  child_options.args = {model_path, config.ToWorkerJson().dump()};
  child_options.pipe_stdin = true;
  child_options.pipe_stdout = true;

  auto child = ChildProcess::Spawn(child_options, error);
  if (!child) {
    return nullptr;
  }
  std::unique_ptr<ProcessTransport> transport(
      new ProcessTransport(std::move(child), options));

  std::string wait_error;
  json ready =
      transport->AwaitMessage({"ready"}, options.ready_timeout, wait_error);
  if (ready.is_null() || ready.value("type", "") != "ready") {
    error = ready.is_null() ? wait_error : ErrorText(ready);
    const std::string tail = transport->child_->StderrTail(500);
    if (!tail.empty()) {
      error += ". Stderr: " + tail;
    }
    transport->shut_down_ = true;
    transport->child_->Kill();
    return nullptr;
  }
  log::Info("facade", "legacy worker ready",
            "pid=" + std::to_string(transport->pid()) + " model=" + model_path);
  return transport;
}

ProcessTransport::ProcessTransport(std::unique_ptr<ChildProcess> child,
                                   ProcessTransportOptions options)
    : child_(std::move(child)), options_(options) {}

ProcessTransport::~ProcessTransport() { Shutdown(); }

json ProcessTransport::AwaitMessage(std::initializer_list<const char *> accept,
                                    std::chrono::milliseconds timeout,
                                    std::string &error) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string line;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      error = "worker timed out after " + std::to_string(timeout.count()) +
              " ms";
      return json();
    }
    auto status = child_->ReadLine(line, remaining);
    if (status == ChildProcess::ReadStatus::kTimeout) {
      continue;
    }
    if (status == ChildProcess::ReadStatus::kEof) {
      error = "worker closed its output";
      return json();
    }
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
      // Workers may print diagnostics on stdout.
      log::Debug("facade", "ignoring worker output", line);
      continue;
    }
    const std::string type = message.value("type", "");
    if (type == "error") {
      return message;
    }
    if (std::any_of(accept.begin(), accept.end(),
                    [&type](const char *want) { return type == want; })) {
      return message;
    }
    log::Debug("facade", "worker message", "type=" + type);
  }
}

bool ProcessTransport::Send(const json &request, std::string &error) {
  if (shut_down_ || !child_->WriteLine(request.dump())) {
    error = "worker is not accepting requests";
    return false;
  }
  return true;
}

GenerationResult ProcessTransport::Abandon(const std::string &error) {
  // A late reply would otherwise be read as the answer to the next request.
  log::Warn("facade", "legacy worker abandoned",
            "pid=" + std::to_string(child_->pid()) + " " + error);
  shut_down_ = true;
  child_->Kill();
  return TransportFailure(error);
}

GenerationResult ProcessTransport::Request(json request, bool chat) {
  request["stream"] = false;
  std::string error;
  if (!Send(request, error)) {
    return TransportFailure(error);
  }
  json reply = AwaitMessage({chat ? "chat_completion" : "completion"},
                            options_.request_timeout, error);
  if (reply.is_null()) {
    return Abandon(error);
  }
  GenerationResult result;
  result.raw = reply;
  if (reply.value("type", "") == "error") {
    result.error = ErrorText(reply);
    return result;
  }
  if (chat) {
    const auto &message = reply.value("message", json::object());
    result.content =
        message.is_object() ? message.value("content", std::string()) : "";
  } else {
    result.content = reply.value("text", std::string());
  }
  result.finish_reason = reply.value("finish_reason", std::string("stop"));
  ReadWorkerUsage(reply, result);
  result.ok = true;
  return result;
}

GenerationResult ProcessTransport::Stream(json request,
                                          const DeltaCallback &on_delta) {
  request["stream"] = true;
  std::string error;
  if (!Send(request, error)) {
    return TransportFailure(error);
  }
  json start =
      AwaitMessage({"stream_start"}, options_.stream_start_timeout, error);
  if (start.is_null()) {
    return Abandon(error);
  }
  GenerationResult result;
  if (start.value("type", "") == "error") {
    result.error = ErrorText(start);
    return result;
  }

  bool delivering = true;
  while (true) {
    json message = AwaitMessage({"stream_token", "stream_end"},
                                options_.request_timeout, error);
    if (message.is_null()) {
      GenerationResult failed = Abandon(error);
      failed.content = result.content;
      return failed;
    }
    const std::string type = message.value("type", "");
    if (type == "error") {
      result.error = ErrorText(message);
      return result;
    }
    if (type == "stream_end") {
      break;
    }
    const std::string token = message.value("token", std::string());
    if (token.empty()) {
      continue;
    }
    result.content += token;
    ++result.completion_tokens;
    // The worker keeps generating after the consumer stops, so the rest of
    // the stream is drained to keep the protocol in step.
    if (delivering && on_delta && !on_delta(token)) {
      delivering = false;
    }
  }
  result.total_tokens = result.completion_tokens;
  result.finish_reason = "stop";
  result.ok = true;
  return result;
}

GenerationResult ProcessTransport::Complete(const std::string &prompt,
                                            const SamplingParams &params) {
  json request = SamplingFields(params);
  request["type"] = "completion";
  request["prompt"] = prompt;
  return Request(std::move(request), false);
}

GenerationResult
ProcessTransport::Chat(const std::vector<ChatMessage> &messages,
                       const SamplingParams &params) {
  json request = SamplingFields(params);
  request["type"] = "chat";
  request["messages"] = MessagesToJson(messages);
  return Request(std::move(request), true);
}

GenerationResult
ProcessTransport::StreamComplete(const std::string &prompt,
                                 const SamplingParams &params,
                                 const DeltaCallback &on_delta) {
  json request = SamplingFields(params);
  request["type"] = "completion";
  request["prompt"] = prompt;
  return Stream(std::move(request), on_delta);
}

GenerationResult
ProcessTransport::StreamChat(const std::vector<ChatMessage> &messages,
                             const SamplingParams &params,
                             const DeltaCallback &on_delta) {
  json request = SamplingFields(params);
  request["type"] = "chat";
  request["messages"] = MessagesToJson(messages);
  return Stream(std::move(request), on_delta);
}

bool ProcessTransport::Ping() {
  std::string error;
  if (!Send(json{{"type", "ping"}}, error)) {
    return false;
  }
  json pong = AwaitMessage({"pong"}, options_.unload_timeout, error);
  if (pong.is_null()) {
    Abandon(error);
    return false;
  }
  return pong.value("type", "") == "pong";
}

bool ProcessTransport::IsAlive() { return !shut_down_ && child_->IsRunning(); }

void ProcessTransport::Shutdown() {
  if (shut_down_) {
    return;
  }
  std::string error;
  if (child_->IsRunning() && Send(json{{"type", "unload"}}, error)) {
    json reply = AwaitMessage({"unload_success"}, options_.unload_timeout, error);
    if (reply.is_null()) {
      log::Warn("facade", "legacy worker did not confirm unload", error);
    }
  }
  shut_down_ = true;
  child_->CloseStdin();
  if (!child_->Terminate(options_.unload_timeout)) {
    log::Warn("facade", "legacy worker killed after grace period",
              "pid=" + std::to_string(child_->pid()));
  }
}

} // namespace infergate
