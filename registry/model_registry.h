#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace infergate {

// Resolves a model id to the weights file the native server should load.
class ModelLocator {
public:
  virtual ~ModelLocator() = default;
  virtual std::optional<std::filesystem::path>
  Resolve(const std::string &model_id) const = 0;
};

struct RegistryEntry {
  std::string id;      // file stem of `path` when not given
  std::string path;    // GGUF weights
  std::string backend; // preferred backend id, "" = active backend
};

// Model ids backed by registry.yaml, re-read when the file's mtime changes.
//
//   models:
//     - id: llama3-8b
//       path: /models/llama3-8b-q4.gguf
//       backend: vulkan
//     - path: /models/mistral-7b.gguf   # id "mistral-7b"
//
// A reload replaces every file entry at once; entries added with Register()
// are kept and shadow file entries with the same id. All methods are
// thread-safe.
class ModelRegistry : public ModelLocator {
public:
  ModelRegistry() = default;
  ~ModelRegistry() override;
  ModelRegistry(const ModelRegistry &) = delete;
  ModelRegistry &operator=(const ModelRegistry &) = delete;

  // Load() followed by a watcher thread polling every `poll_interval_ms`.
  // Returns 0 without doing anything when already watching.
  int LoadAndWatch(const std::filesystem::path &path,
                   int poll_interval_ms = 5000);

  // Reads `path` once. Returns the number of file entries (0 when the file is
  // missing or invalid).
  int Load(const std::filesystem::path &path);

  // Re-reads the current file. Returns -1 and keeps the previous entries when
  // the file is missing or invalid.
  int Reload();

  // Joins the watcher. Safe to call more than once.
  void Stop();
  bool IsWatching() const { return watching_.load(); }

  void Register(const std::string &model_id,
                const std::filesystem::path &path,
                const std::string &backend = "");

  std::optional<std::filesystem::path>
  Resolve(const std::string &model_id) const override;
  std::optional<RegistryEntry> Find(const std::string &model_id) const;
  // Sorted by id.
  std::vector<RegistryEntry> Entries() const;
  std::set<std::string> Ids() const;

  // False on malformed YAML. A document without a models sequence is empty.
  static bool ParseYaml(const std::string &yaml_text,
                        std::vector<RegistryEntry> &out);

private:
  void Watch(int poll_interval_ms);
  std::filesystem::path CurrentPath() const;

  // Guards path_, file_entries_ and manual_entries_.
  mutable std::mutex mutex_;
  std::filesystem::path path_;
  std::map<std::string, RegistryEntry> file_entries_;
  std::map<std::string, RegistryEntry> manual_entries_;

  std::atomic<bool> watching_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::thread watcher_;
};

} // namespace infergate
