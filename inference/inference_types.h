#pragma once

#include "orchestrator/server_config.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace infergate {

// How a loaded model is reached. Chosen once at load time.
enum class LoadMode { kServerBacked, kProcessBacked, kLibraryBacked };

const char *LoadModeName(LoadMode mode);
// Accepts "server", "process" and "library".
std::optional<LoadMode> ParseLoadMode(const std::string &text);

// Per-model runtime configuration. The sampling fields are defaults that a
// request's SamplingParams may override.
struct InferenceConfig {
  int context_size{4096};
  int batch_size{512};
  int threads{0}; // 0 = let the server decide
  int gpu_layers{-1};
  int parallel{1};
  std::string backend_id; // empty = active backend
  bool flash_attention{false};
  // Every other native server option (mmap, numa, tensor split, cache types,
  // seed, ...). The runtime fields above replace the matching fields here;
  // the orchestrator fills in model_path and, when 0, port.
  ServerConfig server_options;
  // Extra native server flags, appended verbatim.
  std::vector<std::string> server_args;

  double temperature{0.7};
  double top_p{0.95};
  int top_k{40};
  double repeat_penalty{1.1};
  int max_tokens{2048};
  std::vector<std::string> stop_sequences;

  // server_options merged with the runtime fields. BuildServerArgs still
  // validates the result.
  ServerConfig ToServerConfig(const std::string &model_path) const;
  // Configuration argument passed to a legacy worker.
  nlohmann::json ToWorkerJson() const;
};

void to_json(nlohmann::json &j, const InferenceConfig &config);

// Request-level overrides. Unset fields fall back to the model's config.
struct SamplingParams {
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<int> top_k;
  std::optional<double> repeat_penalty;
  std::vector<std::string> stop;
  std::optional<int> seed;
};

// Fills every unset field of `request` from `config`.
SamplingParams ResolveSampling(const SamplingParams &request,
                               const InferenceConfig &config);
// Writes the set fields into an OpenAI-style request body.
void ApplySampling(const SamplingParams &params, nlohmann::json &body);

struct ChatMessage {
  std::string role; // system, user, assistant
  std::string content;
  std::string timestamp; // ISO-8601, empty when not recorded
};

void to_json(nlohmann::json &j, const ChatMessage &message);
nlohmann::json MessagesToJson(const std::vector<ChatMessage> &messages);

struct GenerationResult {
  bool ok{false};
  std::string content;
  std::string finish_reason;
  int prompt_tokens{0};
  int completion_tokens{0};
  int total_tokens{0};
  nlohmann::json raw; // backend reply, when there is one
  std::string error;
  // The failure came from the transport rather than the model.
  bool transport_error{false};
};

void to_json(nlohmann::json &j, const GenerationResult &result);

// Receives generated text as it arrives. Returning false stops delivery.
using DeltaCallback = std::function<bool(const std::string &delta)>;

} // namespace infergate
