#include "orchestrator/server_state_store.h"

#include "logging/logger.h"

#include <unistd.h>

#include <fstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace infergate {

ServerStateStore::ServerStateStore(fs::path path) : path_(std::move(path)) {}

std::map<std::string, ServerInstance> ServerStateStore::Load() const {
  std::map<std::string, ServerInstance> servers;
  std::error_code ec;
  if (path_.empty() || !fs::exists(path_, ec)) {
    return servers;
  }
  std::ifstream in(path_);
  if (!in) {
    log::Warn("state_store", "cannot open state file: " + path_.string());
    return servers;
  }
  try {
    json root = json::parse(in);
    if (!root.contains("servers") || !root["servers"].is_object()) {
      return servers;
    }
    for (const auto &[model_id, entry] : root["servers"].items()) {
      ServerInstance instance = entry.get<ServerInstance>();
      if (instance.model_id.empty()) {
        instance.model_id = model_id;
      }
      servers[model_id] = std::move(instance);
    }
  } catch (const json::exception &ex) {
    log::Warn("state_store", "ignoring corrupt state file: " + path_.string(),
              ex.what());
    servers.clear();
  }
  return servers;
}

bool ServerStateStore::Save(
    const std::map<std::string, ServerInstance> &servers) const {
  if (path_.empty()) {
    return true;
  }
  json root;
  root["servers"] = json::object();
  for (const auto &[model_id, instance] : servers) {
    root["servers"][model_id] = instance;
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
  }
  fs::path tmp = path_;
  tmp += ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << root.dump(2);
    if (!out) {
      log::Error("state_store", "failed to write " + tmp.string());
      fs::remove(tmp, ec);
      return false;
    }
  }
  fs::rename(tmp, path_, ec);
  if (ec) {
    log::Error("state_store", "failed to replace " + path_.string(),
               ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

bool ServerStateStore::Clear() const {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    log::Warn("state_store", "failed to remove " + path_.string(),
              ec.message());
    return false;
  }
  return true;
}

} // namespace infergate
