#include "backends/backend_catalog.h"

#include "logging/logger.h"
#include "util/time_format.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace infergate {

namespace {

constexpr const char *kMarkerFile = "installed.json";

std::string ServerBinaryName(const HostPlatform &platform) {
  return platform.os == "Windows" ? "llama-server.exe" : "llama-server";
}

bool IsRegularFile(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

// A backend id names exactly one directory under the backends root.
bool IsBackendDirName(const std::string &id) {
  return !id.empty() && id != "." && id != ".." &&
         id.find_first_of("/\\") == std::string::npos;
}

std::string JsonString(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

} // namespace

BackendCatalog::BackendCatalog(fs::path backends_dir, fs::path download_dir,
                               std::shared_ptr<BackendInstaller> installer,
                               HostPlatform platform)
    : backends_dir_(std::move(backends_dir)),
      download_dir_(std::move(download_dir)),
      installer_(std::move(installer)), platform_(std::move(platform)) {}

std::optional<InstallMarker>
BackendCatalog::ReadMarker(const std::string &backend_id) const {
  if (!IsBackendDirName(backend_id)) {
    return std::nullopt;
  }
  const fs::path marker_path = backends_dir_ / backend_id / kMarkerFile;
  if (!IsRegularFile(marker_path)) {
    return std::nullopt;
  }
  std::ifstream in(marker_path);
  if (!in) {
    return std::nullopt;
  }
  try {
    json j = json::parse(in);
    InstallMarker marker;
    marker.version = JsonString(j, "version");
    marker.backend_id = JsonString(j, "backend_id");
    marker.cuda_version = JsonString(j, "cuda_version");
    marker.asset_name = JsonString(j, "asset_name");
    marker.installed_date = JsonString(j, "installed_date");
    marker.platform = JsonString(j, "platform");
    marker.arch = JsonString(j, "arch");
    if (marker.backend_id.empty()) {
      marker.backend_id = backend_id;
    }
    return marker;
  } catch (const json::exception &ex) {
    log::Warn("catalog", "Ignoring unreadable marker " + marker_path.string(),
              ex.what());
    return std::nullopt;
  }
}

bool BackendCatalog::IsInstalled(const std::string &backend_id) const {
  return ReadMarker(backend_id).has_value();
}

Backend BackendCatalog::MakeBackend(const std::string &id) const {
  const auto traits = DescribeBackendTarget(ParseBackendTarget(id));
  Backend backend;
  backend.id = id;
  backend.display_name = traits.display_name;
  backend.description = traits.description;
  backend.size_hint = traits.size_hint;
  backend.requires_gpu = traits.requires_gpu;
  if (auto marker = ReadMarker(id)) {
    backend.installed = true;
    backend.installed_version = marker->version;
    backend.install_path = backends_dir_ / id;
  }
  return backend;
}

std::vector<Backend> BackendCatalog::ListAvailable() const {
  std::vector<Backend> out;
  for (const auto &[id, pattern] : PlatformAssets(platform_)) {
    out.push_back(MakeBackend(id));
  }
  return out;
}

std::vector<Backend> BackendCatalog::ListInstalled() const {
  std::vector<std::string> ids;
  std::error_code ec;
  if (!fs::is_directory(backends_dir_, ec)) {
    return {};
  }
  for (const auto &entry : fs::directory_iterator(backends_dir_, ec)) {
    if (entry.is_directory(ec) &&
        IsRegularFile(entry.path() / kMarkerFile)) {
      ids.push_back(entry.path().filename().string());
    }
  }
  std::sort(ids.begin(), ids.end());

  std::vector<Backend> out;
  for (const auto &id : ids) {
    Backend backend = MakeBackend(id);
    if (backend.installed) {
      out.push_back(std::move(backend));
    }
  }
  return out;
}

std::optional<Backend> BackendCatalog::ActiveBackend() const {
  auto installed = ListInstalled();
  if (installed.empty()) {
    return std::nullopt;
  }
  for (const auto &backend : installed) {
    if (backend.requires_gpu) {
      return backend;
    }
  }
  return installed.front();
}

std::optional<fs::path>
BackendCatalog::GetServerExecutable(const std::string &backend_id) const {
  std::string id = backend_id;
  if (id.empty()) {
    auto active = ActiveBackend();
    if (!active) {
      return std::nullopt;
    }
    id = active->id;
  }
  if (!IsBackendDirName(id)) {
    return std::nullopt;
  }
  const fs::path dir = backends_dir_ / id;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return std::nullopt;
  }
  const std::string binary = ServerBinaryName(platform_);
  for (const auto &candidate : {dir / "bin" / binary, dir / binary}) {
    if (IsRegularFile(candidate)) {
      return candidate;
    }
  }
  // Release archives unpack into a versioned sub-directory.
  std::vector<fs::path> matches;
  for (auto it = fs::recursive_directory_iterator(dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const auto &path = it->path();
    const std::string name = path.filename().string();
    if (name.rfind("llama-server", 0) != 0 || !IsRegularFile(path)) {
      continue;
    }
    const std::string ext = path.extension().string();
    if (ext.empty() || ext == ".exe") {
      matches.push_back(path);
    }
  }
  if (matches.empty()) {
    return std::nullopt;
  }
  std::sort(matches.begin(), matches.end());
  return matches.front();
}

std::string BackendCatalog::GetRecommended() const {
  const auto assets = PlatformAssets(platform_);
  for (const auto &id : RecommendedPriority(platform_)) {
    for (const auto &[asset_id, pattern] : assets) {
      if (asset_id == id) {
        return id;
      }
    }
  }
  return "cpu";
}

BackendOpResult BackendCatalog::Download(const std::string &backend_id,
                                         const ProgressCallback &progress,
                                         const std::atomic<bool> *cancel) {
  BackendOpResult result;
  std::string pattern;
  for (const auto &[id, asset_pattern] : PlatformAssets(platform_)) {
    if (id == backend_id) {
      pattern = asset_pattern;
    }
  }
  if (pattern.empty()) {
    result.message = "Backend " + backend_id + " not available for " +
                     platform_.os + "/" + platform_.arch;
    return result;
  }
  if (!installer_) {
    result.message = "No backend installer configured";
    return result;
  }

  const fs::path dest = backends_dir_ / backend_id;
  std::error_code ec;
  fs::create_directories(download_dir_, ec);
  fs::remove_all(dest, ec);
  fs::create_directories(dest, ec);
  if (ec) {
    result.message = "Cannot create " + dest.string() + ": " + ec.message();
    return result;
  }

  log::Info("catalog", "Installing backend " + backend_id);
  InstallRequest request{backend_id, pattern, platform_, dest, download_dir_};
  InstallOutcome outcome = installer_->Install(request, progress, cancel);
  if (!outcome.ok) {
    fs::remove_all(dest, ec);
    result.message = outcome.error;
    log::Warn("catalog", "Install of " + backend_id + " failed",
              outcome.error);
    return result;
  }

  if (progress) {
    progress(90, "Writing install marker...");
  }
  InstallMarker marker = outcome.marker;
  marker.backend_id = backend_id;
  marker.installed_date = IsoTimestampNow();
  marker.platform = platform_.os;
  marker.arch = platform_.arch;
  json j = {{"version", marker.version},
            {"backend_id", marker.backend_id},
            {"cuda_version", marker.cuda_version.empty()
                                 ? json(nullptr)
                                 : json(marker.cuda_version)},
            {"asset_name", marker.asset_name},
            {"installed_date", marker.installed_date},
            {"platform", marker.platform},
            {"arch", marker.arch}};
  std::ofstream out(dest / kMarkerFile);
  out << j.dump(2);
  if (!out) {
    result.message = "Failed to write install marker in " + dest.string();
    return result;
  }

  if (progress) {
    progress(100, backend_id + " installed successfully!");
  }
  result.ok = true;
  result.message = backend_id + " backend installed successfully";
  result.version = marker.version;
  result.path = dest;
  return result;
}

BackendOpResult BackendCatalog::Uninstall(const std::string &backend_id) {
  BackendOpResult result;
  if (!IsBackendDirName(backend_id)) {
    result.message = "Invalid backend id: " + backend_id;
    log::Warn("catalog", "Refusing to uninstall", "id=" + backend_id);
    return result;
  }
  const fs::path dir = backends_dir_ / backend_id;
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    result.message = "Backend " + backend_id + " not installed";
    return result;
  }
  fs::remove_all(dir, ec);
  if (ec) {
    result.message = ec.message();
    return result;
  }
  log::Info("catalog", "Uninstalled backend " + backend_id);
  result.ok = true;
  result.message = backend_id + " uninstalled successfully";
  result.path = dir;
  return result;
}

std::optional<fs::path>
BackendCatalog::LibrarySearchPath(const std::string &backend_id) const {
  if (!DescribeBackendTarget(ParseBackendTarget(backend_id)).requires_gpu ||
      !IsInstalled(backend_id)) {
    return std::nullopt;
  }
  // Shared libraries ship beside the server binary.
  if (auto exe = GetServerExecutable(backend_id)) {
    return exe->parent_path();
  }
  return backends_dir_ / backend_id;
}

} // namespace infergate
