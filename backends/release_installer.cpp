#include "backends/release_installer.h"

#include "logging/logger.h"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <regex>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace infergate {

namespace {

std::string ReplaceAll(std::string value, const std::string &from,
                       const std::string &to) {
  std::size_t pos = 0;
  while ((pos = value.find(from, pos)) != std::string::npos) {
    value.replace(pos, from.size(), to);
    pos += to.size();
  }
  return value;
}

bool EndsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

std::string FormatMegabytes(long long bytes) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", bytes / 1024.0 / 1024.0);
  return buf;
}

bool Cancelled(const std::atomic<bool> *cancel) {
  return cancel && cancel->load();
}

// fork/exec the archiver and wait for it; output goes to /dev/null.
int RunTool(const std::vector<std::string> &argv) {
  std::vector<char *> args;
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    return -1;
  }
  if (pid == 0) {
    FILE *devnull = std::fopen("/dev/null", "w");
    if (devnull) {
      ::dup2(fileno(devnull), STDOUT_FILENO);
      ::dup2(fileno(devnull), STDERR_FILENO);
    }
    ::execvp(args[0], args.data());
    _exit(127);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

bool ExtractArchive(const fs::path &archive, const fs::path &dest,
                    std::string &error) {
  const std::string name = archive.filename().string();
  std::vector<std::string> argv;
  if (EndsWith(name, ".zip")) {
    argv = {"unzip", "-o", "-q", archive.string(), "-d", dest.string()};
  } else {
    argv = {"tar", "-xf", archive.string(), "-C", dest.string()};
  }
  int rc = RunTool(argv);
  if (rc != 0) {
    error = argv[0] + " failed on " + name +
            (rc == 127 ? " (tool not found)"
                       : " (exit code " + std::to_string(rc) + ")");
    return false;
  }
  return true;
}

ReleaseInstaller::ReleaseInstaller() : ReleaseInstaller(Options{}) {}

ReleaseInstaller::ReleaseInstaller(Options options)
    : options_(std::move(options)) {}

std::string ReleaseInstaller::FindLatestCudaVersion(const json &assets) {
  static const std::regex kCudaAsset(R"(win-cuda-(\d+)\.(\d+)-x64)");
  int best_major = -1;
  int best_minor = -1;
  for (const auto &asset : assets) {
    if (!asset.is_object() || !asset.contains("name")) {
      continue;
    }
    const std::string name = asset["name"].get<std::string>();
    std::smatch match;
    if (!std::regex_search(name, match, kCudaAsset)) {
      continue;
    }
    int major = std::stoi(match[1].str());
    int minor = std::stoi(match[2].str());
    if (major > best_major || (major == best_major && minor > best_minor)) {
      best_major = major;
      best_minor = minor;
    }
  }
  if (best_major < 0) {
    return "";
  }
  return std::to_string(best_major) + "." + std::to_string(best_minor);
}

std::vector<std::string>
ReleaseInstaller::CandidateAssetNames(const std::string &pattern,
                                      const std::string &version,
                                      const std::string &cuda) {
  std::string name = ReplaceAll(pattern, "{version}", version);
  name = ReplaceAll(name, "{cuda_version}", cuda);
  return {name, ReplaceAll(name, "-x64", "-x86_64"),
          ReplaceAll(name, ".zip", ".tar.gz")};
}

bool ReleaseInstaller::FetchRelease(json &release, std::string &error) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  const auto now = std::chrono::steady_clock::now();
  if (!release_cache_.is_null() &&
      now - cache_time_ < options_.metadata_cache_ttl) {
    release = release_cache_;
    return true;
  }
  try {
    auto response = client_.Get(options_.release_api_url,
                                {{"Accept", "application/vnd.github.v3+json"},
                                 {"User-Agent", "infergate"}},
                                options_.metadata_timeout);
    if (!response.Ok()) {
      error = "release metadata request returned HTTP " +
              std::to_string(response.status);
      return false;
    }
    release_cache_ = json::parse(response.body);
    cache_time_ = now;
    release = release_cache_;
    return true;
  } catch (const std::exception &ex) {
    error = std::string("failed to fetch release information: ") + ex.what();
    return false;
  }
}

bool ReleaseInstaller::DownloadFile(const std::string &url,
                                    const fs::path &dest,
                                    long long expected_size,
                                    const ProgressCallback &progress,
                                    const std::atomic<bool> *cancel,
                                    std::string &error) {
  std::string current = url;
  for (int hop = 0; hop <= options_.max_redirects; ++hop) {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "cannot write " + dest.string();
      return false;
    }
    std::string location;
    int status = 0;
    long long total = expected_size;
    long long downloaded = 0;
    int last_percent = -1;
    bool write_failed = false;

    HttpClient::StreamHandlers handlers;
    handlers.on_headers = [&](int code, const HttpHeaders &headers) {
      status = code;
      if (code >= 300 && code < 400) {
        auto it = headers.find("location");
        if (it != headers.end()) {
          location = it->second;
        }
        return false;
      }
      if (code < 200 || code >= 300) {
        return false;
      }
      if (total <= 0) {
        auto it = headers.find("content-length");
        if (it != headers.end()) {
          try {
            total = std::stoll(it->second);
          } catch (const std::exception &) {
            total = 0;
          }
        }
      }
      return true;
    };
    handlers.on_body = [&](const char *data, std::size_t length) {
      if (Cancelled(cancel)) {
        return false;
      }
      out.write(data, static_cast<std::streamsize>(length));
      if (!out) {
        write_failed = true;
        return false;
      }
      downloaded += static_cast<long long>(length);
      if (progress && total > 0) {
        // Downloading spans 10-70% of the whole install.
        int percent = 10 + static_cast<int>((downloaded * 60) / total);
        if (percent != last_percent) {
          last_percent = percent;
          progress(percent, "Downloading: " + FormatMegabytes(downloaded) +
                                " / " + FormatMegabytes(total) + " MB");
        }
      }
      return true;
    };

    try {
      client_.Stream("GET", current, "", {{"User-Agent", "infergate"}},
                     options_.download_timeout, handlers);
    } catch (const std::exception &ex) {
      error = std::string("download failed: ") + ex.what();
      return false;
    }
    out.close();

    if (!location.empty()) {
      current = location;
      continue;
    }
    if (Cancelled(cancel)) {
      error = "download cancelled";
      return false;
    }
    if (write_failed) {
      error = "failed writing " + dest.string();
      return false;
    }
    if (status < 200 || status >= 300) {
      error = "download returned HTTP " + std::to_string(status);
      return false;
    }
    if (total > 0 && downloaded < total) {
      error = "download truncated at " + std::to_string(downloaded) + " of " +
              std::to_string(total) + " bytes";
      return false;
    }
    return true;
  }
  error = "too many redirects";
  return false;
}

InstallOutcome ReleaseInstaller::Install(const InstallRequest &request,
                                         const ProgressCallback &progress,
                                         const std::atomic<bool> *cancel) {
  InstallOutcome outcome;
  auto report = [&](int percent, const std::string &message) {
    if (progress) {
      progress(percent, message);
    }
  };

  report(5, "Fetching release information...");
  json release;
  if (!FetchRelease(release, outcome.error)) {
    return outcome;
  }
  const std::string version = release.value("tag_name", "unknown");
  const json assets = release.value("assets", json::array());

  std::string cuda_version;
  if (request.backend_id == "cuda") {
    cuda_version = FindLatestCudaVersion(assets);
    if (cuda_version.empty()) {
      outcome.error = "No CUDA binaries found in release";
      return outcome;
    }
    report(8, "Found latest CUDA version: " + cuda_version);
  }

  const auto candidates =
      CandidateAssetNames(request.asset_pattern, version, cuda_version);
  const json *asset = nullptr;
  for (const auto &name : candidates) {
    for (const auto &entry : assets) {
      if (entry.value("name", "") == name) {
        asset = &entry;
        break;
      }
    }
    if (asset) {
      break;
    }
  }
  if (!asset) {
    outcome.error = "Asset not found for " + request.backend_id +
                    ". Looking for: " + candidates.front();
    return outcome;
  }

  const std::string asset_name = asset->value("name", "");
  const std::string url = asset->value("browser_download_url", "");
  const long long size = asset->value("size", 0LL);
  report(10, "Downloading " + asset_name + " (" + FormatMegabytes(size) +
                 " MB)...");

  const fs::path archive = request.download_dir / asset_name;
  if (!DownloadFile(url, archive, size, progress, cancel, outcome.error)) {
    std::error_code ec;
    fs::remove(archive, ec);
    return outcome;
  }
  if (Cancelled(cancel)) {
    outcome.error = "download cancelled";
    return outcome;
  }

  report(70, "Extracting files...");
  if (!ExtractArchive(archive, request.dest_dir, outcome.error)) {
    return outcome;
  }

  // CUDA builds on Windows need the matching cudart package beside them.
  if (request.platform.os == "Windows" && request.backend_id == "cuda") {
    const std::string cudart =
        "cudart-llama-bin-win-cuda-" + cuda_version + "-x64.zip";
    for (const auto &entry : assets) {
      if (entry.value("name", "") != cudart) {
        continue;
      }
      report(80, "Downloading CUDA " + cuda_version + " runtime libraries...");
      const fs::path cudart_path = request.download_dir / cudart;
      std::string cudart_error;
      if (DownloadFile(entry.value("browser_download_url", ""), cudart_path,
                       entry.value("size", 0LL), nullptr, cancel,
                       cudart_error)) {
        report(85, "Extracting CUDA runtime...");
        if (!ExtractArchive(cudart_path, request.dest_dir, cudart_error)) {
          log::Warn("installer", "CUDA runtime extraction failed",
                    cudart_error);
        }
      } else {
        log::Warn("installer", "CUDA runtime download failed", cudart_error);
      }
      break;
    }
  }

  log::Info("installer", "Installed " + asset_name,
            "backend=" + request.backend_id + " version=" + version);
  outcome.ok = true;
  outcome.marker.version = version;
  outcome.marker.cuda_version = cuda_version;
  outcome.marker.asset_name = asset_name;
  return outcome;
}

} // namespace infergate
