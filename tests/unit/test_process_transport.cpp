#include <catch2/catch.hpp>

#include "inference/process_transport.h"

#include <signal.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace infergate;

namespace {

ProcessTransportOptions QuickOptions() {
  ProcessTransportOptions options;
  options.ready_timeout = std::chrono::milliseconds(5000);
  options.request_timeout = std::chrono::milliseconds(5000);
  options.stream_start_timeout = std::chrono::milliseconds(5000);
  options.unload_timeout = std::chrono::milliseconds(2000);
  return options;
}

std::unique_ptr<ProcessTransport> LaunchWorker(const std::string &model,
                                               std::string &error) {
  return ProcessTransport::Launch(INFERGATE_FAKE_LEGACY_WORKER, model,
                                  InferenceConfig{}, error, QuickOptions());
}

} // namespace

TEST_CASE("ProcessTransport waits for ready past stray output",
          "[process_transport]") {
  std::string error;
  auto worker = LaunchWorker("/models/llama3.gguf", error);
  REQUIRE(worker);
  REQUIRE(error.empty());
  REQUIRE(worker->mode() == LoadMode::kProcessBacked);
  REQUIRE(worker->IsAlive());
  REQUIRE(worker->Ping());
}

TEST_CASE("ProcessTransport reports a worker that fails to load",
          "[process_transport]") {
  std::string error;
  auto worker = LaunchWorker("/models/fail.gguf", error);
  REQUIRE_FALSE(worker);
  REQUIRE(error.find("Failed to load model") != std::string::npos);
}

TEST_CASE("ProcessTransport reports a worker that cannot be spawned",
          "[process_transport]") {
  std::string error;
  auto worker = ProcessTransport::Launch("/nonexistent/worker", "/m.gguf",
                                         InferenceConfig{}, error,
                                         QuickOptions());
  REQUIRE_FALSE(worker);
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("ProcessTransport completes and chats", "[process_transport]") {
  std::string error;
  auto worker = LaunchWorker("/models/llama3.gguf", error);
  REQUIRE(worker);

  auto completion = worker->Complete("tell me", SamplingParams{});
  REQUIRE(completion.ok);
  REQUIRE(completion.content == "echo: tell me");
  REQUIRE(completion.completion_tokens == 3);
  REQUIRE(completion.prompt_tokens == 2);

  std::vector<ChatMessage> messages{{"system", "be brief", ""},
                                    {"user", "hello there", ""}};
  auto chat = worker->Chat(messages, SamplingParams{});
  REQUIRE(chat.ok);
  REQUIRE(chat.content == "worker reply: hello there");
  REQUIRE(chat.finish_reason == "stop");
}

TEST_CASE("ProcessTransport streams tokens and drains after a stop",
          "[process_transport]") {
  std::string error;
  auto worker = LaunchWorker("/models/llama3.gguf", error);
  REQUIRE(worker);

  std::vector<std::string> deltas;
  auto streamed = worker->StreamComplete(
      "one two three", SamplingParams{}, [&deltas](const std::string &delta) {
        deltas.push_back(delta);
        return true;
      });
  REQUIRE(streamed.ok);
  REQUIRE(streamed.content == "echo: one two three");
  REQUIRE(deltas.size() == 4u);
  REQUIRE(streamed.completion_tokens == 4);

  int delivered = 0;
  auto stopped = worker->StreamChat(
      {{"user", "a b c d", ""}}, SamplingParams{},
      [&delivered](const std::string &) { return ++delivered < 2; });
  REQUIRE(stopped.ok);
  REQUIRE(delivered == 2);

  // The drained stream leaves the protocol in step for the next request.
  auto next = worker->Complete("again", SamplingParams{});
  REQUIRE(next.ok);
  REQUIRE(next.content == "echo: again");
}

TEST_CASE("ProcessTransport shutdown unloads the worker",
          "[process_transport]") {
  std::string error;
  auto worker = LaunchWorker("/models/llama3.gguf", error);
  REQUIRE(worker);
  const int pid = worker->pid();

  worker->Shutdown();
  REQUIRE_FALSE(worker->IsAlive());
  REQUIRE(::kill(pid, 0) != 0);
  worker->Shutdown();

  auto after = worker->Complete("x", SamplingParams{});
  REQUIRE_FALSE(after.ok);
  REQUIRE(after.transport_error);
}

TEST_CASE("ProcessTransport notices a dead worker", "[process_transport]") {
  std::string error;
  auto worker = LaunchWorker("/models/llama3.gguf", error);
  REQUIRE(worker);

  ::kill(worker->pid(), SIGKILL);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  auto result = worker->Complete("hello", SamplingParams{});
  REQUIRE_FALSE(result.ok);
  REQUIRE(result.transport_error);
  REQUIRE_FALSE(worker->IsAlive());
}

TEST_CASE("ProcessTransport kills a worker whose reply times out",
          "[process_transport]") {
  ProcessTransportOptions options = QuickOptions();
  options.request_timeout = std::chrono::milliseconds(300);
  std::string error;
  auto worker = ProcessTransport::Launch(INFERGATE_FAKE_LEGACY_WORKER,
                                         "/models/llama3.gguf",
                                         InferenceConfig{}, error, options);
  REQUIRE(worker);
  const int pid = worker->pid();

  auto late = worker->Complete("slow first", SamplingParams{});
  REQUIRE_FALSE(late.ok);
  REQUIRE(late.transport_error);
  REQUIRE_FALSE(worker->IsAlive());
  REQUIRE(::kill(pid, 0) != 0);

  // The reply to the first prompt must never surface as the second answer.
  std::this_thread::sleep_for(std::chrono::milliseconds(1000));
  auto next = worker->Complete("second", SamplingParams{});
  REQUIRE_FALSE(next.ok);
  REQUIRE(next.transport_error);
  REQUIRE(next.content.empty());
}
