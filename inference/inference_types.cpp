#include "inference/inference_types.h"

using json = nlohmann::json;

namespace infergate {

const char *LoadModeName(LoadMode mode) {
  switch (mode) {
  case LoadMode::kServerBacked:
    return "server";
  case LoadMode::kProcessBacked:
    return "process";
  case LoadMode::kLibraryBacked:
    return "library";
  }
  return "unknown";
}

std::optional<LoadMode> ParseLoadMode(const std::string &text) {
  if (text == "server") {
    return LoadMode::kServerBacked;
  }
  if (text == "process" || text == "subprocess") {
    return LoadMode::kProcessBacked;
  }
  if (text == "library" || text == "direct") {
    return LoadMode::kLibraryBacked;
  }
  return std::nullopt;
}

ServerConfig InferenceConfig::ToServerConfig(const std::string &model_path) const {
  ServerConfig server = server_options;
  server.model_path = model_path;
  server.context_size = context_size;
  server.gpu_layers = gpu_layers;
  server.threads = threads;
  server.batch_size = batch_size;
  server.parallel = parallel;
  server.flash_attention = flash_attention || server_options.flash_attention;
  server.extra_args.insert(server.extra_args.end(), server_args.begin(),
                           server_args.end());
  return server;
}

json InferenceConfig::ToWorkerJson() const {
  // Key names follow the worker's llama.cpp binding.
  return json{{"n_ctx", context_size},
              {"n_batch", batch_size},
              {"n_threads", threads > 0 ? threads : 4},
              {"n_gpu_layers", gpu_layers},
              {"verbose", false}};
}

void to_json(json &j, const InferenceConfig &config) {
  j = json{{"context_size", config.context_size},
           {"batch_size", config.batch_size},
           {"threads", config.threads},
           {"gpu_layers", config.gpu_layers},
           {"parallel", config.parallel},
           {"backend", config.backend_id},
           {"temperature", config.temperature},
           {"top_p", config.top_p},
           {"top_k", config.top_k},
           {"repeat_penalty", config.repeat_penalty},
           {"max_tokens", config.max_tokens},
           {"stop_sequences", config.stop_sequences}};
}

SamplingParams ResolveSampling(const SamplingParams &request,
                               const InferenceConfig &config) {
  SamplingParams out = request;
  if (!out.max_tokens) {
    out.max_tokens = config.max_tokens;
  }
  if (!out.temperature) {
    out.temperature = config.temperature;
  }
  if (!out.top_p) {
    out.top_p = config.top_p;
  }
  if (!out.top_k) {
    out.top_k = config.top_k;
  }
  if (!out.repeat_penalty) {
    out.repeat_penalty = config.repeat_penalty;
  }
  if (out.stop.empty()) {
    out.stop = config.stop_sequences;
  }
  return out;
}

void ApplySampling(const SamplingParams &params, json &body) {
  if (params.max_tokens) {
    body["max_tokens"] = *params.max_tokens;
  }
  if (params.temperature) {
    body["temperature"] = *params.temperature;
  }
  if (params.top_p) {
    body["top_p"] = *params.top_p;
  }
  if (params.top_k) {
    body["top_k"] = *params.top_k;
  }
  if (params.repeat_penalty) {
    body["repeat_penalty"] = *params.repeat_penalty;
  }
  if (!params.stop.empty()) {
    body["stop"] = params.stop;
  }
  if (params.seed) {
    body["seed"] = *params.seed;
  }
}

void to_json(json &j, const ChatMessage &message) {
  j = json{{"role", message.role}, {"content", message.content}};
  if (!message.timestamp.empty()) {
    j["timestamp"] = message.timestamp;
  }
}

json MessagesToJson(const std::vector<ChatMessage> &messages) {
  json out = json::array();
  for (const auto &message : messages) {
    out.push_back({{"role", message.role}, {"content", message.content}});
  }
  return out;
}

void to_json(json &j, const GenerationResult &result) {
  j = json{{"ok", result.ok},
           {"content", result.content},
           {"finish_reason", result.finish_reason},
           {"usage",
            {{"prompt_tokens", result.prompt_tokens},
             {"completion_tokens", result.completion_tokens},
             {"total_tokens", result.total_tokens}}}};
  if (!result.error.empty()) {
    j["error"] = result.error;
  }
}

} // namespace infergate
