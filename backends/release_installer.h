#pragma once

#include "backends/backend_catalog.h"
#include "net/http_client.h"

#include <chrono>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace infergate {

// Installs prebuilt llama.cpp server builds from a GitHub-style release:
// looks up the asset for the backend, downloads it with progress reporting
// and cooperative cancellation, then unpacks it with the system archiver
// ("unzip" for .zip, "tar" otherwise).
class ReleaseInstaller : public BackendInstaller {
public:
  struct Options {
    // Release metadata endpoint ("latest" or a tagged release).
    std::string release_api_url{
        "https://api.github.com/repos/ggml-org/llama.cpp/releases/latest"};
    std::chrono::milliseconds metadata_timeout{10000};
    std::chrono::milliseconds download_timeout{600000};
    std::chrono::seconds metadata_cache_ttl{300};
    int max_redirects{5};
  };

  ReleaseInstaller();
  explicit ReleaseInstaller(Options options);

  InstallOutcome Install(const InstallRequest &request,
                         const ProgressCallback &progress,
                         const std::atomic<bool> *cancel) override;

  // Highest "win-cuda-<major>.<minor>-x64" version among the asset names.
  static std::string FindLatestCudaVersion(const nlohmann::json &assets);
  // Candidate asset names for a pattern, in lookup order.
  static std::vector<std::string> CandidateAssetNames(const std::string &pattern,
                                                      const std::string &version,
                                                      const std::string &cuda);

private:
  bool FetchRelease(nlohmann::json &release, std::string &error);
  bool DownloadFile(const std::string &url, const std::filesystem::path &dest,
                    long long expected_size, const ProgressCallback &progress,
                    const std::atomic<bool> *cancel, std::string &error);

  Options options_;
  HttpClient client_;
  std::mutex cache_mutex_;
  nlohmann::json release_cache_;
  std::chrono::steady_clock::time_point cache_time_{};
};

// Runs an archiver to unpack `archive` into `dest`. Returns false and fills
// `error` when the tool is missing or exits non-zero.
bool ExtractArchive(const std::filesystem::path &archive,
                    const std::filesystem::path &dest, std::string &error);

} // namespace infergate
