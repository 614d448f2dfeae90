#pragma once

#include <optional>
#include <string>
#include <vector>

namespace infergate {

// Launch options for one llama-server process. The required fields are always
// passed; every other flag is passed only when it is set, so the server's own
// defaults apply otherwise.
struct ServerConfig {
  std::string model_path;
  std::string host{"127.0.0.1"};
  int port{0}; // 0 = allocate from the orchestrator's range
  int context_size{4096};
  int gpu_layers{-1}; // -1 = all layers on the GPU
  int batch_size{512};
  int parallel{1};

  int threads{0}; // 0 = server picks
  bool embedding{false};

  bool flash_attention{false};
  bool no_mmap{false};
  bool mlock{false};
  std::string numa; // distribute | isolate | numactl
  std::vector<double> tensor_split;
  std::optional<int> main_gpu;
  std::string split_mode;   // none | layer | row
  std::string rope_scaling; // none | linear | yarn
  std::optional<double> rope_freq_base;
  std::optional<double> rope_freq_scale;
  std::optional<int> seed;
  std::optional<int> threads_batch;
  std::optional<int> ubatch_size;
  std::string cache_type_k;
  std::string cache_type_v;
  bool no_cont_batching{false};
  std::optional<double> defrag_threshold;
  std::string chat_template;
  std::string alias;
  // Handed to the server as LLAMA_API_KEY so it never shows up in argv.
  std::string api_key;
  std::optional<int> timeout_seconds;
  std::string slot_save_path;
  bool no_webui{false};

  // Appended verbatim after every generated flag.
  std::vector<std::string> extra_args;
};

struct ServerArgsResult {
  bool ok{false};
  std::vector<std::string> args;
  std::string error;
};

// Maps a config to the llama-server argument list (without argv[0]).
// Invalid values produce ok=false and a message naming the field. The API
// key is not part of the list.
ServerArgsResult BuildServerArgs(const ServerConfig &config);

} // namespace infergate
