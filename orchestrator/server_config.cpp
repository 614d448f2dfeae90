#include "orchestrator/server_config.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace infergate {

namespace {

std::string FormatNumber(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%g", value);
  return buf;
}

bool OneOf(const std::string &value, std::initializer_list<const char *> set) {
  return std::any_of(set.begin(), set.end(),
                     [&value](const char *item) { return value == item; });
}

bool IsCacheType(const std::string &value) {
  return OneOf(value, {"f32", "f16", "bf16", "q8_0", "q4_0", "q4_1", "iq4_nl",
                       "q5_0", "q5_1"});
}

} // namespace

ServerArgsResult BuildServerArgs(const ServerConfig &config) {
  ServerArgsResult result;
  auto fail = [&result](const std::string &message) {
    result.ok = false;
    result.args.clear();
    result.error = message;
    return result;
  };

  if (config.model_path.empty()) {
    return fail("model_path is required");
  }
  if (config.host.empty()) {
    return fail("host is required");
  }
  if (config.port <= 0 || config.port > 65535) {
    return fail("port must be in 1..65535, got " +
                std::to_string(config.port));
  }
  if (config.context_size <= 0) {
    return fail("context_size must be positive");
  }
  if (config.gpu_layers < -1) {
    return fail("gpu_layers must be -1 (all) or >= 0");
  }
  if (config.batch_size <= 0) {
    return fail("batch_size must be positive");
  }
  if (config.parallel <= 0) {
    return fail("parallel must be positive");
  }
  if (config.threads < 0) {
    return fail("threads must be >= 0");
  }

  auto &args = result.args;
  args = {"--model",        config.model_path,
          "--host",         config.host,
          "--port",         std::to_string(config.port),
          "--ctx-size",     std::to_string(config.context_size),
          "--n-gpu-layers", std::to_string(config.gpu_layers),
          "--batch-size",   std::to_string(config.batch_size),
          "--parallel",     std::to_string(config.parallel)};

  if (config.threads > 0) {
    args.insert(args.end(), {"--threads", std::to_string(config.threads)});
  }
  if (config.embedding) {
    args.push_back("--embedding");
  }
  if (config.flash_attention) {
    args.push_back("--flash-attn");
  }
  if (config.no_mmap) {
    args.push_back("--no-mmap");
  }
  if (config.mlock) {
    args.push_back("--mlock");
  }
  if (!config.numa.empty()) {
    if (!OneOf(config.numa, {"distribute", "isolate", "numactl"})) {
      return fail("numa must be distribute, isolate or numactl");
    }
    args.insert(args.end(), {"--numa", config.numa});
  }
  if (!config.tensor_split.empty()) {
    std::string csv;
    for (double part : config.tensor_split) {
      if (part < 0.0 || !std::isfinite(part)) {
        return fail("tensor_split entries must be non-negative");
      }
      if (!csv.empty()) {
        csv += ",";
      }
      csv += FormatNumber(part);
    }
    args.insert(args.end(), {"--tensor-split", csv});
  }
  if (config.main_gpu) {
    if (*config.main_gpu < 0) {
      return fail("main_gpu must be >= 0");
    }
    args.insert(args.end(), {"--main-gpu", std::to_string(*config.main_gpu)});
  }
  if (!config.split_mode.empty()) {
    if (!OneOf(config.split_mode, {"none", "layer", "row"})) {
      return fail("split_mode must be none, layer or row");
    }
    args.insert(args.end(), {"--split-mode", config.split_mode});
  }
  if (!config.rope_scaling.empty()) {
    if (!OneOf(config.rope_scaling, {"none", "linear", "yarn"})) {
      return fail("rope_scaling must be none, linear or yarn");
    }
    args.insert(args.end(), {"--rope-scaling", config.rope_scaling});
  }
  if (config.rope_freq_base) {
    args.insert(args.end(),
                {"--rope-freq-base", FormatNumber(*config.rope_freq_base)});
  }
  if (config.rope_freq_scale) {
    args.insert(args.end(),
                {"--rope-freq-scale", FormatNumber(*config.rope_freq_scale)});
  }
  if (config.seed) {
    args.insert(args.end(), {"--seed", std::to_string(*config.seed)});
  }
  if (config.threads_batch) {
    if (*config.threads_batch <= 0) {
      return fail("threads_batch must be positive");
    }
    args.insert(args.end(),
                {"--threads-batch", std::to_string(*config.threads_batch)});
  }
  if (config.ubatch_size) {
    if (*config.ubatch_size <= 0) {
      return fail("ubatch_size must be positive");
    }
    args.insert(args.end(),
                {"--ubatch-size", std::to_string(*config.ubatch_size)});
  }
  if (!config.cache_type_k.empty()) {
    if (!IsCacheType(config.cache_type_k)) {
      return fail("unsupported cache_type_k " + config.cache_type_k);
    }
    args.insert(args.end(), {"--cache-type-k", config.cache_type_k});
  }
  if (!config.cache_type_v.empty()) {
    if (!IsCacheType(config.cache_type_v)) {
      return fail("unsupported cache_type_v " + config.cache_type_v);
    }
    args.insert(args.end(), {"--cache-type-v", config.cache_type_v});
  }
  if (config.no_cont_batching) {
    args.push_back("--no-cont-batching");
  }
  if (config.defrag_threshold) {
    args.insert(args.end(),
                {"--defrag-thold", FormatNumber(*config.defrag_threshold)});
  }
  if (!config.chat_template.empty()) {
    args.insert(args.end(), {"--chat-template", config.chat_template});
  }
  if (!config.alias.empty()) {
    args.insert(args.end(), {"--alias", config.alias});
  }
  if (config.timeout_seconds) {
    if (*config.timeout_seconds <= 0) {
      return fail("timeout_seconds must be positive");
    }
    args.insert(args.end(),
                {"--timeout", std::to_string(*config.timeout_seconds)});
  }
  if (!config.slot_save_path.empty()) {
    args.insert(args.end(), {"--slot-save-path", config.slot_save_path});
  }
  if (config.no_webui) {
    args.push_back("--no-webui");
  }
  args.insert(args.end(), config.extra_args.begin(), config.extra_args.end());

  result.ok = true;
  return result;
}

} // namespace infergate
