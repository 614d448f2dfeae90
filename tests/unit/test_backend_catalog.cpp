#include <catch2/catch.hpp>

#include "backends/backend_catalog.h"
#include "backends/backend_traits.h"
#include "backends/release_installer.h"
#include "test_fixtures.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace infergate;
using infergate_test::TempDir;
using infergate_test::WriteMarker;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Installer stub: drops a fake server into a versioned sub-directory, the
// way release archives unpack.
// ---------------------------------------------------------------------------

class StubInstaller : public BackendInstaller {
public:
  InstallOutcome Install(const InstallRequest &request,
                         const ProgressCallback &progress,
                         const std::atomic<bool> *cancel) override {
    requests.push_back(request);
    InstallOutcome outcome;
    if (cancel && cancel->load()) {
      outcome.error = "Installation cancelled";
      return outcome;
    }
    if (fail) {
      outcome.error = "Asset not found for " + request.backend_id;
      return outcome;
    }
    if (progress) {
      progress(50, "Extracting...");
    }
    const fs::path bin = request.dest_dir / "build" / "bin";
    fs::create_directories(bin);
    std::ofstream(bin / "llama-server") << "#!/bin/sh\n";
    std::ofstream(bin / "libggml.so") << "";
    outcome.ok = true;
    outcome.marker.version = "b4321";
    outcome.marker.asset_name = "llama-b4321-bin-ubuntu-x64.zip";
    return outcome;
  }

  bool fail{false};
  std::vector<InstallRequest> requests;
};

static const HostPlatform kLinux{"Linux", "x64"};

// ---------------------------------------------------------------------------
// [catalog] tests
// ---------------------------------------------------------------------------

TEST_CASE("BackendCatalog lists platform backends", "[catalog]") {
  TempDir dir;
  BackendCatalog catalog(dir / "backends", dir / "downloads", nullptr, kLinux);

  auto available = catalog.ListAvailable();
  REQUIRE(available.size() == 2u);
  REQUIRE(available[0].id == "cpu");
  REQUIRE(available[1].id == "vulkan");
  REQUIRE(available[1].requires_gpu);
  REQUIRE_FALSE(available[0].installed);
  REQUIRE(catalog.ListInstalled().empty());
  REQUIRE_FALSE(catalog.ActiveBackend().has_value());
  REQUIRE_FALSE(catalog.GetServerExecutable().has_value());
  REQUIRE(catalog.GetRecommended() == "vulkan");
}

TEST_CASE("BackendCatalog installs through the installer", "[catalog]") {
  TempDir dir;
  auto installer = std::make_shared<StubInstaller>();
  BackendCatalog catalog(dir / "backends", dir / "downloads", installer,
                         kLinux);

  std::vector<int> percents;
  auto result = catalog.Download(
      "cpu", [&percents](int pct, const std::string &) {
        percents.push_back(pct);
      });
  REQUIRE(result.ok);
  REQUIRE(result.version == "b4321");
  REQUIRE(percents.back() == 100);
  REQUIRE(installer->requests.at(0).asset_pattern ==
          "llama-{version}-bin-ubuntu-x64.zip");

  auto marker = catalog.ReadMarker("cpu");
  REQUIRE(marker.has_value());
  REQUIRE(marker->backend_id == "cpu");
  REQUIRE(marker->platform == "Linux");
  REQUIRE_FALSE(marker->installed_date.empty());

  auto exe = catalog.GetServerExecutable("cpu");
  REQUIRE(exe.has_value());
  REQUIRE(*exe == dir / "backends" / "cpu" / "build" / "bin" / "llama-server");
  REQUIRE(catalog.ActiveBackend()->id == "cpu");
}

TEST_CASE("BackendCatalog failed installs leave nothing behind", "[catalog]") {
  TempDir dir;
  auto installer = std::make_shared<StubInstaller>();
  installer->fail = true;
  BackendCatalog catalog(dir / "backends", dir / "downloads", installer,
                         kLinux);

  auto result = catalog.Download("vulkan");
  REQUIRE_FALSE(result.ok);
  REQUIRE(result.message.find("Asset not found") != std::string::npos);
  REQUIRE_FALSE(fs::exists(dir / "backends" / "vulkan"));

  std::atomic<bool> cancel{true};
  installer->fail = false;
  auto cancelled = catalog.Download("cpu", nullptr, &cancel);
  REQUIRE_FALSE(cancelled.ok);
  REQUIRE_FALSE(catalog.IsInstalled("cpu"));
}

TEST_CASE("BackendCatalog refuses unknown backends and missing installer",
          "[catalog]") {
  TempDir dir;
  BackendCatalog catalog(dir / "backends", dir / "downloads", nullptr, kLinux);
  auto metal = catalog.Download("metal");
  REQUIRE_FALSE(metal.ok);
  REQUIRE(metal.message.find("not available") != std::string::npos);

  auto cpu = catalog.Download("cpu");
  REQUIRE_FALSE(cpu.ok);
  REQUIRE(cpu.message.find("installer") != std::string::npos);
}

TEST_CASE("BackendCatalog prefers an installed GPU backend", "[catalog]") {
  TempDir dir;
  const fs::path backends = dir / "backends";
  WriteMarker(backends, "cpu");
  WriteMarker(backends, "vulkan", "b5000");
  fs::create_directories(backends / "vulkan" / "bin");
  std::ofstream(backends / "vulkan" / "bin" / "llama-server") << "";
  // A directory without a marker is not installed.
  fs::create_directories(backends / "hip");

  BackendCatalog catalog(backends, dir / "downloads", nullptr, kLinux);
  auto installed = catalog.ListInstalled();
  REQUIRE(installed.size() == 2u);
  REQUIRE(installed[0].id == "cpu");
  REQUIRE(installed[1].installed_version == "b5000");

  auto active = catalog.ActiveBackend();
  REQUIRE(active.has_value());
  REQUIRE(active->id == "vulkan");
  REQUIRE(catalog.GetServerExecutable() ==
          backends / "vulkan" / "bin" / "llama-server");

  // GPU runtimes ship their libraries next to the server binary.
  REQUIRE(catalog.LibrarySearchPath("vulkan") == backends / "vulkan" / "bin");
  REQUIRE_FALSE(catalog.LibrarySearchPath("cpu").has_value());
}

TEST_CASE("BackendCatalog ignores unreadable markers", "[catalog]") {
  TempDir dir;
  fs::create_directories(dir / "backends" / "cpu");
  std::ofstream(dir / "backends" / "cpu" / "installed.json") << "{oops";
  BackendCatalog catalog(dir / "backends", dir / "downloads", nullptr, kLinux);
  REQUIRE_FALSE(catalog.IsInstalled("cpu"));
  REQUIRE(catalog.ListInstalled().empty());
}

TEST_CASE("BackendCatalog Uninstall removes the backend", "[catalog]") {
  TempDir dir;
  WriteMarker(dir / "backends", "cpu");
  BackendCatalog catalog(dir / "backends", dir / "downloads", nullptr, kLinux);

  REQUIRE(catalog.Uninstall("cpu").ok);
  REQUIRE_FALSE(catalog.IsInstalled("cpu"));
  REQUIRE_FALSE(catalog.Uninstall("cpu").ok);
}

TEST_CASE("BackendCatalog Uninstall stays inside the backends directory",
          "[catalog]") {
  TempDir dir;
  WriteMarker(dir / "backends", "cpu");
  std::ofstream(dir / "config.yaml") << "log_level: info\n";
  BackendCatalog catalog(dir / "backends", dir / "downloads", nullptr, kLinux);

  for (const char *id : {"..", ".", "", "../backends", "cpu/..", "..\\x"}) {
    auto result = catalog.Uninstall(id);
    REQUIRE_FALSE(result.ok);
  }
  REQUIRE(fs::exists(dir / "config.yaml"));
  REQUIRE(catalog.IsInstalled("cpu"));
  REQUIRE_FALSE(catalog.GetServerExecutable("..").has_value());
  REQUIRE_FALSE(catalog.IsInstalled("../backends/cpu"));
}

// ---------------------------------------------------------------------------
// [backend_traits] tests
// ---------------------------------------------------------------------------

TEST_CASE("ParseBackendTarget accepts aliases", "[backend_traits]") {
  REQUIRE(ParseBackendTarget("CUDA-12") == BackendTarget::kCuda);
  REQUIRE(ParseBackendTarget("rocm") == BackendTarget::kHip);
  REQUIRE(ParseBackendTarget("mps") == BackendTarget::kMetal);
  REQUIRE(ParseBackendTarget("vulkan") == BackendTarget::kVulkan);
  REQUIRE(ParseBackendTarget("opencl-adreno") == BackendTarget::kOpenClAdreno);
  REQUIRE(ParseBackendTarget("tpu") == BackendTarget::kCpu);
}

TEST_CASE("Backend tables follow the platform", "[backend_traits]") {
  auto windows = PlatformAssets({"Windows", "x64"});
  REQUIRE(windows.size() == 5u);
  REQUIRE(windows[1].first == "cuda");
  REQUIRE(windows[1].second.find("{cuda_version}") != std::string::npos);

  REQUIRE(PlatformAssets({"Windows", "arm64"})[1].first == "opencl-adreno");
  REQUIRE(PlatformAssets({"Darwin", "arm64"})[0].first == "metal");
  REQUIRE(PlatformAssets({"Linux", "s390x"}).size() == 1u);
  REQUIRE(PlatformAssets({"Linux", "arm64"}).empty());

  REQUIRE(RecommendedPriority({"Windows", "x64"}).front() == "cuda");
  REQUIRE(std::string(LibrarySearchVariable({"Linux", "x64"})) ==
          "LD_LIBRARY_PATH");
  REQUIRE(std::string(LibrarySearchVariable({"Darwin", "arm64"})) ==
          "DYLD_LIBRARY_PATH");
  REQUIRE(std::string(LibrarySearchVariable({"Windows", "x64"})) == "PATH");
}

TEST_CASE("DescribeBackendTarget marks GPU backends", "[backend_traits]") {
  REQUIRE_FALSE(DescribeBackendTarget(BackendTarget::kCpu).requires_gpu);
  auto cuda = DescribeBackendTarget(BackendTarget::kCuda);
  REQUIRE(cuda.requires_gpu);
  REQUIRE(cuda.gpu_vendor == "nvidia");
  REQUIRE(cuda.id == "cuda");
}

// ---------------------------------------------------------------------------
// [release] tests
// ---------------------------------------------------------------------------

TEST_CASE("ReleaseInstaller picks the newest CUDA build", "[release]") {
  json assets = json::array(
      {{{"name", "llama-b1-bin-win-cuda-11.7-x64.zip"}},
       {{"name", "llama-b1-bin-win-cuda-12.4-x64.zip"}},
       {{"name", "cudart-llama-bin-win-cuda-12.10-x64.zip"}},
       {{"name", "llama-b1-bin-ubuntu-x64.zip"}},
       "not an object"});
  REQUIRE(ReleaseInstaller::FindLatestCudaVersion(assets) == "12.10");
  REQUIRE(ReleaseInstaller::FindLatestCudaVersion(json::array()).empty());
}

TEST_CASE("ReleaseInstaller expands asset name candidates", "[release]") {
  auto names = ReleaseInstaller::CandidateAssetNames(
      "llama-{version}-bin-win-cuda-{cuda_version}-x64.zip", "b4000", "12.4");
  REQUIRE(names.size() == 3u);
  REQUIRE(names[0] == "llama-b4000-bin-win-cuda-12.4-x64.zip");
  REQUIRE(names[1] == "llama-b4000-bin-win-cuda-12.4-x86_64.zip");
  REQUIRE(names[2] == "llama-b4000-bin-win-cuda-12.4-x64.tar.gz");
}

TEST_CASE("ExtractArchive reports a failing archiver", "[release]") {
  TempDir dir;
  std::string error;
  REQUIRE_FALSE(
      ExtractArchive(dir / "missing.tar.gz", dir / "out", error));
  REQUIRE(error.find("missing.tar.gz") != std::string::npos);
}
