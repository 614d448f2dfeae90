#include "registry/model_registry.h"

#include "logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace infergate {

namespace {

std::string Scalar(const YAML::Node &node, const char *key) {
  const YAML::Node value = node[key];
  return value && value.IsScalar() ? value.as<std::string>() : std::string();
}

fs::file_time_type ModifiedAt(const fs::path &path) {
  std::error_code ec;
  auto mtime = fs::last_write_time(path, ec);
  return ec ? fs::file_time_type::min() : mtime;
}

} // namespace

ModelRegistry::~ModelRegistry() { Stop(); }

bool ModelRegistry::ParseYaml(const std::string &yaml_text,
                              std::vector<RegistryEntry> &out) {
  try {
    const YAML::Node models = YAML::Load(yaml_text)["models"];
    if (!models || !models.IsSequence()) {
      log::Warn("registry", "no models sequence in registry");
      return true;
    }
    for (const auto &node : models) {
      RegistryEntry entry;
      entry.path = Scalar(node, "path");
      if (entry.path.empty()) {
        log::Warn("registry", "entry without a path skipped",
                  "id=" + Scalar(node, "id"));
        continue;
      }
      entry.id = Scalar(node, "id");
      if (entry.id.empty()) {
        entry.id = fs::path(entry.path).stem().string();
      }
      entry.backend = Scalar(node, "backend");
      out.push_back(std::move(entry));
    }
  } catch (const YAML::Exception &ex) {
    log::Error("registry", "malformed registry", ex.what());
    return false;
  }
  return true;
}

fs::path ModelRegistry::CurrentPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return path_;
}

int ModelRegistry::Load(const fs::path &path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = path;
  }
  const int count = Reload();
  return count < 0 ? 0 : count;
}

int ModelRegistry::Reload() {
  const fs::path path = CurrentPath();
  std::ifstream in(path);
  if (!in) {
    log::Warn("registry", "registry file unreadable", path.string());
    return -1;
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());

  std::vector<RegistryEntry> parsed;
  if (!ParseYaml(text, parsed)) {
    return -1;
  }
  std::map<std::string, RegistryEntry> next;
  for (auto &entry : parsed) {
    const std::string id = entry.id;
    if (!next.emplace(id, std::move(entry)).second) {
      log::Warn("registry", "duplicate model id ignored", "id=" + id);
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, entry] : next) {
    auto old = file_entries_.find(id);
    if (old == file_entries_.end()) {
      log::Info("registry", "model added", "id=" + id + " path=" + entry.path);
    } else if (old->second.path != entry.path) {
      log::Info("registry", "model moved", "id=" + id + " path=" + entry.path);
    }
  }
  for (const auto &[id, entry] : file_entries_) {
    if (next.find(id) == next.end()) {
      log::Info("registry", "model removed", "id=" + id);
    }
  }
  file_entries_.swap(next);
  return static_cast<int>(file_entries_.size());
}

int ModelRegistry::LoadAndWatch(const fs::path &path, int poll_interval_ms) {
  if (watching_.exchange(true)) {
    return 0;
  }
  const int count = Load(path);
  watcher_ = std::thread([this, poll_interval_ms] { Watch(poll_interval_ms); });
  return count;
}

void ModelRegistry::Stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (!watching_.exchange(false)) {
      return;
    }
  }
  wake_.notify_all();
  if (watcher_.joinable()) {
    watcher_.join();
  }
}

void ModelRegistry::Watch(int poll_interval_ms) {
  const fs::path path = CurrentPath();
  auto seen = ModifiedAt(path);
  std::unique_lock<std::mutex> lock(wake_mutex_);
  while (watching_.load()) {
    wake_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms),
                   [this] { return !watching_.load(); });
    if (!watching_.load()) {
      break;
    }
    const auto mtime = ModifiedAt(path);
    if (mtime == seen) {
      continue;
    }
    seen = mtime;
    lock.unlock();
    log::Info("registry", "registry changed, reloading", path.string());
    Reload();
    lock.lock();
  }
}

void ModelRegistry::Register(const std::string &model_id, const fs::path &path,
                             const std::string &backend) {
  RegistryEntry entry{model_id.empty() ? path.stem().string() : model_id,
                      path.string(), backend};
  std::lock_guard<std::mutex> lock(mutex_);
  manual_entries_[entry.id] = std::move(entry);
}

std::optional<RegistryEntry>
ModelRegistry::Find(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto *entries : {&manual_entries_, &file_entries_}) {
    auto it = entries->find(model_id);
    if (it != entries->end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

std::optional<fs::path>
ModelRegistry::Resolve(const std::string &model_id) const {
  if (auto entry = Find(model_id)) {
    return fs::path(entry->path);
  }
  return std::nullopt;
}

std::vector<RegistryEntry> ModelRegistry::Entries() const {
  std::map<std::string, RegistryEntry> merged;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    merged = file_entries_;
    for (const auto &[id, entry] : manual_entries_) {
      merged[id] = entry;
    }
  }
  std::vector<RegistryEntry> out;
  out.reserve(merged.size());
  for (auto &[id, entry] : merged) {
    out.push_back(std::move(entry));
  }
  return out;
}

std::set<std::string> ModelRegistry::Ids() const {
  std::set<std::string> ids;
  for (const auto &entry : Entries()) {
    ids.insert(entry.id);
  }
  return ids;
}

} // namespace infergate
