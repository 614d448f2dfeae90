#pragma once

#include "backends/backend_traits.h"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace infergate {

struct Backend {
  std::string id;
  std::string display_name;
  std::string description;
  std::string size_hint;
  bool requires_gpu{false};
  bool installed{false};
  std::string installed_version;
  std::filesystem::path install_path;
};

// Contents of <backends>/<id>/installed.json.
struct InstallMarker {
  std::string version;
  std::string backend_id;
  std::string cuda_version;
  std::string asset_name;
  std::string installed_date;
  std::string platform;
  std::string arch;
};

struct BackendOpResult {
  bool ok{false};
  std::string message;
  std::string version;
  std::filesystem::path path;
};

// (percent 0-100, human readable status)
using ProgressCallback = std::function<void(int, const std::string &)>;

struct InstallRequest {
  std::string backend_id;
  std::string asset_pattern;
  HostPlatform platform;
  std::filesystem::path dest_dir;
  std::filesystem::path download_dir;
};

struct InstallOutcome {
  bool ok{false};
  std::string error;
  // version / cuda_version / asset_name; the catalog fills in the rest.
  InstallMarker marker;
};

// Fetches and unpacks the server binaries for one backend into dest_dir.
class BackendInstaller {
public:
  virtual ~BackendInstaller() = default;
  virtual InstallOutcome Install(const InstallRequest &request,
                                 const ProgressCallback &progress,
                                 const std::atomic<bool> *cancel) = 0;
};

class BackendCatalog {
public:
  // A null installer makes Download() fail with a configuration error.
  BackendCatalog(std::filesystem::path backends_dir,
                 std::filesystem::path download_dir,
                 std::shared_ptr<BackendInstaller> installer = nullptr,
                 HostPlatform platform = DetectHostPlatform());

  // Backends published for this platform, with installed state merged in.
  std::vector<Backend> ListAvailable() const;
  // Backends carrying a readable installed.json marker, ordered by id.
  std::vector<Backend> ListInstalled() const;
  // First installed GPU backend, else the first installed backend.
  std::optional<Backend> ActiveBackend() const;

  // Empty id selects ActiveBackend(). Returns nullopt when nothing usable is
  // installed.
  std::optional<std::filesystem::path>
  GetServerExecutable(const std::string &backend_id = "") const;

  std::string GetRecommended() const;

  BackendOpResult Download(const std::string &backend_id,
                           const ProgressCallback &progress = nullptr,
                           const std::atomic<bool> *cancel = nullptr);
  BackendOpResult Uninstall(const std::string &backend_id);

  // Directory holding the shared libraries of an installed GPU backend, to
  // be prepended to LibrarySearchVariable() when spawning its server.
  std::optional<std::filesystem::path>
  LibrarySearchPath(const std::string &backend_id) const;

  bool IsInstalled(const std::string &backend_id) const;
  std::optional<InstallMarker> ReadMarker(const std::string &backend_id) const;

  const HostPlatform &platform() const { return platform_; }
  const std::filesystem::path &backends_dir() const { return backends_dir_; }

private:
  Backend MakeBackend(const std::string &id) const;

  std::filesystem::path backends_dir_;
  std::filesystem::path download_dir_;
  std::shared_ptr<BackendInstaller> installer_;
  HostPlatform platform_;
};

} // namespace infergate
