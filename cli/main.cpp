#include "backends/backend_catalog.h"
#include "backends/release_installer.h"
#include "config/app_config.h"
#include "inference/inference_facade.h"
#include "logging/logger.h"
#include "metrics/metrics.h"
#include "orchestrator/server_orchestrator.h"
#include "registry/hardware_profile.h"
#include "registry/model_registry.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_cancel{false};

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  infergatectl backends list|installed|recommend\n"
      << "  infergatectl backends install <id>\n"
      << "      Download a prebuilt llama-server for this platform.\n"
      << "  infergatectl backends uninstall <id>\n"
      << "  infergatectl models\n"
      << "      List models from the registry (~/.infergate/registry.yaml).\n"
      << "  infergatectl status\n"
      << "  infergatectl cleanup\n"
      << "      Kill llama-server processes left behind by a previous run.\n"
      << "  infergatectl complete --model ID --prompt TEXT [--stream]\n"
      << "  infergatectl chat --model ID [--system TEXT] [--message TEXT] "
         "[--stream]\n"
         "                   [--interactive]\n"
      << "  infergatectl metrics --model ID\n"
      << "Common options:\n"
      << "  --config PATH      config file (default ~/.infergate/config.yaml)\n"
      << "  --backend ID       backend to run the model on\n"
      << "  --mode MODE        server (default) or process\n"
      << "  --max-tokens N  --temperature T  --ctx-size N  --gpu-layers N\n"
      << "  --seed N  --flash-attn  --mlock  --no-mmap\n";
}

struct Options {
  std::string config_path;
  std::string model;
  std::string prompt;
  std::string system_prompt;
  std::vector<std::string> messages;
  std::string backend;
  std::string mode{"server"};
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  std::optional<int> ctx_size;
  std::optional<int> gpu_layers;
  std::optional<int> seed;
  bool flash_attention{false};
  bool mlock{false};
  bool no_mmap{false};
  bool stream{false};
  bool interactive{false};
  std::vector<std::string> positional;
};

Options ParseOptions(int argc, char **argv, int first) {
  Options opts;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " requires a value");
      }
      return argv[++i];
    };
    if (arg == "--config") {
      opts.config_path = next();
    } else if (arg == "--model") {
      opts.model = next();
    } else if (arg == "--prompt") {
      opts.prompt = next();
    } else if (arg == "--system") {
      opts.system_prompt = next();
    } else if (arg == "--message" || arg == "-m") {
      opts.messages.push_back(next());
    } else if (arg == "--backend") {
      opts.backend = next();
    } else if (arg == "--mode") {
      opts.mode = next();
    } else if (arg == "--max-tokens" || arg == "--max_tokens") {
      opts.max_tokens = std::stoi(next());
    } else if (arg == "--temperature") {
      opts.temperature = std::stod(next());
    } else if (arg == "--ctx-size") {
      opts.ctx_size = std::stoi(next());
    } else if (arg == "--gpu-layers") {
      opts.gpu_layers = std::stoi(next());
    } else if (arg == "--seed") {
      opts.seed = std::stoi(next());
    } else if (arg == "--flash-attn") {
      opts.flash_attention = true;
    } else if (arg == "--mlock") {
      opts.mlock = true;
    } else if (arg == "--no-mmap") {
      opts.no_mmap = true;
    } else if (arg == "--stream") {
      opts.stream = true;
    } else if (arg == "--interactive") {
      opts.interactive = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("unknown option " + arg);
    } else {
      opts.positional.push_back(arg);
    }
  }
  return opts;
}

// Owns the object graph for one invocation.
struct Runtime {
  explicit Runtime(const infergate::AppConfig &config) : config(config) {
    infergate::ReleaseInstaller::Options installer_options;
    installer_options.release_api_url = config.ReleaseApiUrl();
    catalog = std::make_unique<infergate::BackendCatalog>(
        config.backends_dir, config.downloads_dir,
        std::make_shared<infergate::ReleaseInstaller>(installer_options));
    registry.Load(config.registry_file);
    hardware =
        std::make_unique<infergate::StaticHardwareProfile>(catalog.get());
  }

  infergate::ServerOrchestrator &Orchestrator() {
    if (!orchestrator) {
      orchestrator = std::make_unique<infergate::ServerOrchestrator>(
          catalog.get(), config.orchestrator, nullptr, &metrics);
    }
    return *orchestrator;
  }

  infergate::InferenceFacade &Facade() {
    if (!facade) {
      infergate::FacadeOptions options;
      options.legacy_worker = config.legacy_worker;
      facade = std::make_unique<infergate::InferenceFacade>(
          Orchestrator(), registry, *hardware, catalog.get(), options,
          &metrics);
    }
    return *facade;
  }

  infergate::AppConfig config;
  infergate::MetricsRegistry metrics;
  std::unique_ptr<infergate::BackendCatalog> catalog;
  infergate::ModelRegistry registry;
  std::unique_ptr<infergate::StaticHardwareProfile> hardware;
  // Declared last so they are destroyed first.
  std::unique_ptr<infergate::ServerOrchestrator> orchestrator;
  std::unique_ptr<infergate::InferenceFacade> facade;
};

void PrintBackends(const std::vector<infergate::Backend> &backends) {
  for (const auto &backend : backends) {
    std::cout << backend.id << "\t" << backend.display_name
              << (backend.requires_gpu ? "\tgpu" : "\tcpu");
    if (backend.installed) {
      std::cout << "\tinstalled " << backend.installed_version;
    }
    std::cout << "\n";
  }
}

int CmdBackends(Runtime &rt, const Options &opts) {
  if (opts.positional.empty()) {
    PrintUsage();
    return 1;
  }
  const std::string &action = opts.positional[0];
  auto &catalog = *rt.catalog;
  if (action == "list") {
    PrintBackends(catalog.ListAvailable());
    return 0;
  }
  if (action == "installed") {
    auto installed = catalog.ListInstalled();
    if (installed.empty()) {
      std::cout << "No backends installed. Try: infergatectl backends install "
                << catalog.GetRecommended() << "\n";
      return 0;
    }
    PrintBackends(installed);
    return 0;
  }
  if (action == "recommend") {
    std::cout << catalog.GetRecommended() << "\n";
    return 0;
  }
  if (action == "install" || action == "uninstall") {
    if (opts.positional.size() < 2) {
      std::cerr << "Usage: infergatectl backends " << action << " <id>\n";
      return 1;
    }
    const std::string &id = opts.positional[1];
    infergate::BackendOpResult result;
    if (action == "install") {
      result = catalog.Download(
          id,
          [](int percent, const std::string &message) {
            std::cerr << "\r[" << percent << "%] " << message << "      "
                      << std::flush;
          },
          &g_cancel);
      std::cerr << "\n";
    } else {
      result = catalog.Uninstall(id);
    }
    if (!result.ok) {
      std::cerr << result.message << "\n";
      return 1;
    }
    std::cout << result.message << "\n";
    return 0;
  }
  std::cerr << "Unknown backends action: " << action << "\n";
  return 1;
}

int CmdModels(Runtime &rt) {
  auto entries = rt.registry.Entries();
  if (entries.empty()) {
    std::cout << "No models registered in " << rt.config.registry_file.string()
              << "\n";
    return 0;
  }
  for (const auto &entry : entries) {
    std::cout << entry.id << "\t" << entry.path;
    if (!entry.backend.empty()) {
      std::cout << "\t" << entry.backend;
    }
    std::cout << "\n";
  }
  return 0;
}

int CmdStatus(Runtime &rt) {
  json status;
  status["home"] = rt.config.home.string();
  status["platform"] = {{"os", rt.catalog->platform().os},
                        {"arch", rt.catalog->platform().arch}};
  auto active = rt.catalog->ActiveBackend();
  status["active_backend"] = active ? json(active->id) : json(nullptr);
  status["recommended_backend"] = rt.catalog->GetRecommended();
  auto exe = rt.catalog->GetServerExecutable();
  status["server_executable"] = exe ? json(exe->string()) : json(nullptr);
  status["models"] = rt.registry.Ids();
  // Reading the table directly leaves any recorded processes alone.
  json leftovers = json::object();
  for (const auto &[model_id, instance] :
       infergate::ServerStateStore(rt.config.state_file).Load()) {
    leftovers[model_id] = instance;
  }
  status["recorded_servers"] = leftovers;
  std::cout << status.dump(2) << std::endl;
  return 0;
}

int CmdCleanup(Runtime &rt) {
  auto &orchestrator = rt.Orchestrator();
  std::cout << "Killed " << orchestrator.orphans_killed()
            << " orphaned server(s)\n";
  return 0;
}

infergate::SamplingParams SamplingFrom(const Options &opts) {
  infergate::SamplingParams params;
  params.max_tokens = opts.max_tokens;
  params.temperature = opts.temperature;
  return params;
}

void LoadModel(Runtime &rt, const Options &opts) {
  if (opts.model.empty()) {
    throw std::invalid_argument("--model is required");
  }
  auto mode = infergate::ParseLoadMode(opts.mode);
  if (!mode || *mode == infergate::LoadMode::kLibraryBacked) {
    throw std::invalid_argument("--mode must be server or process");
  }
  auto &facade = rt.Facade();
  infergate::InferenceConfig config = facade.DefaultConfig();
  if (opts.ctx_size) {
    config.context_size = *opts.ctx_size;
  }
  if (opts.gpu_layers) {
    config.gpu_layers = *opts.gpu_layers;
  }
  config.flash_attention = config.flash_attention || opts.flash_attention;
  config.server_options.mlock = opts.mlock;
  config.server_options.no_mmap = opts.no_mmap;
  config.server_options.seed = opts.seed;
  if (!opts.backend.empty()) {
    config.backend_id = opts.backend;
  } else if (auto entry = rt.registry.Find(opts.model)) {
    config.backend_id = entry->backend;
  }
  std::cerr << "Loading " << opts.model << "..." << std::endl;
  facade.Load(opts.model, config, *mode);
}

int Report(const infergate::GenerationResult &result, bool streamed) {
  if (!result.ok) {
    std::cerr << (streamed ? "\n" : "") << "Error: " << result.error << "\n";
    return 1;
  }
  if (streamed) {
    std::cout << std::endl;
  } else {
    std::cout << result.content << std::endl;
  }
  std::cerr << "[" << result.prompt_tokens << " prompt + "
            << result.completion_tokens << " completion tokens"
            << (result.finish_reason.empty() ? ""
                                             : ", " + result.finish_reason)
            << "]\n";
  return 0;
}

bool PrintDelta(const std::string &delta) {
  std::cout << delta << std::flush;
  return !g_cancel.load();
}

int CmdComplete(Runtime &rt, const Options &opts) {
  if (opts.prompt.empty()) {
    std::cerr << "--prompt is required\n";
    return 1;
  }
  LoadModel(rt, opts);
  auto &facade = rt.Facade();
  auto result =
      opts.stream
          ? facade.StreamComplete(opts.model, opts.prompt, PrintDelta,
                                  SamplingFrom(opts))
          : facade.Complete(opts.model, opts.prompt, SamplingFrom(opts));
  return Report(result, opts.stream);
}

int CmdChat(Runtime &rt, const Options &opts) {
  if (!opts.interactive && opts.messages.empty()) {
    std::cerr << "--message or --interactive is required\n";
    return 1;
  }
  LoadModel(rt, opts);
  auto &facade = rt.Facade();
  auto session = facade.CreateSession(opts.model, opts.system_prompt);
  auto send = [&](const std::string &text) {
    return opts.stream ? facade.SendMessageStream(session.id, text, PrintDelta,
                                                  SamplingFrom(opts))
                       : facade.SendMessage(session.id, text,
                                            SamplingFrom(opts));
  };

  int rc = 0;
  for (const auto &message : opts.messages) {
    rc = Report(send(message), opts.stream);
    if (rc != 0) {
      return rc;
    }
  }
  if (!opts.interactive) {
    return rc;
  }
  std::cout << "Interactive chat session " << session.id
            << ". Type /exit to quit." << std::endl;
  std::string line;
  while (!g_cancel.load()) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line) || line == "/exit") {
      break;
    }
    if (line.empty()) {
      continue;
    }
    Report(send(line), opts.stream);
  }
  return 0;
}

int CmdMetrics(Runtime &rt, const Options &opts) {
  LoadModel(rt, opts);
  auto result = rt.Orchestrator().Metrics(opts.model);
  if (!result.ok) {
    std::cerr << result.message << "\n";
    return 1;
  }
  if (result.from_health) {
    std::cout << result.health.dump(2) << "\n";
  } else {
    std::cout << result.prometheus;
  }
  std::cout << rt.metrics.RenderPrometheus();
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  std::string command = argv[1];
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage();
    return 0;
  }

  Options opts;
  try {
    opts = ParseOptions(argc, argv, 2);
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }

  auto config = infergate::LoadAppConfig(
      opts.config_path.empty() ? infergate::DefaultConfigPath()
                               : std::filesystem::path(opts.config_path));
  infergate::ApplyEnvironmentOverrides(config);
  infergate::ApplyLoggingConfig(config);

  // Ctrl-C stops a download or a stream; the runtime then shuts servers down.
  std::signal(SIGINT, [](int) { g_cancel.store(true); });

  try {
    Runtime rt(config);
    if (command == "backends") {
      return CmdBackends(rt, opts);
    }
    if (command == "models") {
      return CmdModels(rt);
    }
    if (command == "status") {
      return CmdStatus(rt);
    }
    if (command == "cleanup") {
      return CmdCleanup(rt);
    }
    if (command == "complete" || command == "completion") {
      return CmdComplete(rt, opts);
    }
    if (command == "chat") {
      return CmdChat(rt, opts);
    }
    if (command == "metrics") {
      return CmdMetrics(rt, opts);
    }
    std::cerr << "Unknown command: " << command << "\n";
    PrintUsage();
    return 1;
  } catch (const std::exception &ex) {
    infergate::log::Error("cli", ex.what());
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
